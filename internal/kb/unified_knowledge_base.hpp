#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/coordinator/transaction_coordinator.hpp"
#include "internal/ledger/change_ledger.hpp"
#include "internal/model/change_event.hpp"
#include "internal/model/story_element.hpp"
#include "internal/registry/entity_registry.hpp"

namespace storykb::kb {

struct KnowledgeBaseOptions {
  std::chrono::milliseconds prepare_timeout = std::chrono::milliseconds(5000);
  std::chrono::milliseconds commit_timeout  = std::chrono::milliseconds(5000);
};

/*
  Entry point for story element writes.

  Every write resolves the canonical id, then runs one coordinator
  transaction; coordinator errors reach the caller unchanged. Writes are
  idempotent: repeating one with the same input leaves both stores as they
  were (node and entry versions do not move, edges are not duplicated).
*/
class UnifiedKnowledgeBase {
 public:
  UnifiedKnowledgeBase(std::shared_ptr<registry::EntityRegistry> registry, std::shared_ptr<coordinator::TransactionCoordinator> coordinator,
                       std::shared_ptr<ledger::ChangeLedger> ledger, KnowledgeBaseOptions options = {});

  /*
    Content write: vector upsert (id, content, {type}) plus graph node
    upsert (id, type, content_hash) plus one edge per relationship, with the
    element as source. The id comes from `natural_key` when given, else
    from "<element_type>:<content_hash>".
  */
  model::EntityIdentifier UpdateStoryElement(const std::string& element_type, const std::string& content,
                                             const std::vector<model::RelationshipSpec>& relationships = {},
                                             const std::optional<std::string>&           natural_key   = std::nullopt);

  // Metadata write: graph-only node upsert merging `properties` per field.
  // NotFound for an id the registry never issued.
  void UpdateElementProperties(const model::EntityIdentifier& entity_id, const std::string& element_type, const model::Properties& properties);

  // Relationship write: graph-only edge upserts from `source_id`.
  void LinkElements(const model::EntityIdentifier& source_id, const std::vector<model::RelationshipSpec>& relationships);

  // Ledger history of the entity in append order.
  std::vector<model::ChangeEvent> Timeline(const model::EntityIdentifier& entity_id);

  static std::string DefaultNaturalKey(const std::string& element_type, const std::string& content_hash);

 private:
  void StageRelationships(coordinator::TransactionHandle& handle, const std::vector<model::RelationshipSpec>& relationships);
  void Run(coordinator::TransactionHandle& handle);

  std::shared_ptr<registry::EntityRegistry>             registry_;
  std::shared_ptr<coordinator::TransactionCoordinator> coordinator_;
  std::shared_ptr<ledger::ChangeLedger>                 ledger_;
  KnowledgeBaseOptions                                  options_;
};

} // namespace storykb::kb

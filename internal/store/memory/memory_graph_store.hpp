#pragma once

#include <map>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/store/graph_store_adapter.hpp"

namespace storykb::store::memory {

/*
  In-process graph store.

  Prepared ops sit in a staging map keyed by token and are applied to the
  visible maps under one exclusive lock at Commit.

  Thread safety:
    - shared reads
    - exclusive writes
*/
class MemoryGraphStore final : public GraphStoreAdapter {
 public:
  MemoryGraphStore() = default;
  ~MemoryGraphStore() override = default;

  std::string_view Name() const override {
    return "graph";
  }

  StoreStatus PrepareWrite(const std::vector<GraphOp>& ops, util::Deadline deadline, StagingToken* token) override;
  StoreStatus Commit(const StagingToken& token, util::Deadline deadline) override;
  StoreStatus Discard(const StagingToken& token) override;

  std::optional<model::GraphNode>  FindNode(const model::EntityIdentifier& id) override;
  std::vector<model::Relationship> FindRelationships(const model::EntityIdentifier& source_id) override;

  std::size_t NodeCount() const;
  std::size_t EdgeCount() const;
  std::size_t StagedCount() const;

 private:
  mutable std::shared_mutex mutex_;

  std::unordered_map<model::EntityIdentifier, model::GraphNode> nodes_;
  std::set<model::Relationship>                                 edges_;
  std::unordered_map<StagingToken, std::vector<GraphOp>>        staged_;
};

} // namespace storykb::store::memory

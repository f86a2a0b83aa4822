#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "internal/model/story_element.hpp"
#include "internal/store/store_status.hpp"
#include "internal/util/time.hpp"

namespace storykb::store {

// Opaque handle to work staged by one PrepareWrite/PrepareUpsert call.
using StagingToken = std::string;

// Upsert by id. content_hash is left untouched when absent.
struct GraphNodeUpsert {
  model::EntityIdentifier    id;
  std::string                type;
  std::optional<std::string> content_hash;
  model::Properties          properties;
};

// Upsert by (source, target, type); re-submitting is a no-op.
struct GraphRelationshipUpsert {
  model::Relationship relationship;
};

using GraphOp = std::variant<GraphNodeUpsert, GraphRelationshipUpsert>;

/*
  Graph store seen by the coordinator.

  PrepareWrite stages ops invisibly to readers and hands back a token.
  Commit makes the staged ops visible atomically; Discard drops them.
  Discarding an unknown or already finished token succeeds.

  Implementations must be thread-safe; each token is used by one caller.
*/
class GraphStoreAdapter {
 public:
  virtual ~GraphStoreAdapter() = default;

  virtual std::string_view Name() const = 0;

  virtual StoreStatus PrepareWrite(const std::vector<GraphOp>& ops, util::Deadline deadline, StagingToken* token) = 0;
  virtual StoreStatus Commit(const StagingToken& token, util::Deadline deadline)                                   = 0;
  virtual StoreStatus Discard(const StagingToken& token)                                                           = 0;

  // Committed state only.
  virtual std::optional<model::GraphNode>  FindNode(const model::EntityIdentifier& id)                 = 0;
  virtual std::vector<model::Relationship> FindRelationships(const model::EntityIdentifier& source_id) = 0;
};

} // namespace storykb::store

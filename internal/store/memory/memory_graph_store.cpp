#include "memory_graph_store.hpp"

#include <mutex>

#include "internal/store/merge.hpp"
#include "internal/util/uuid.hpp"

namespace storykb::store::memory {

StoreStatus MemoryGraphStore::PrepareWrite(const std::vector<GraphOp>& ops, util::Deadline deadline, StagingToken* token) {
  if (token == nullptr) {
    return StoreStatus::Err(StoreErrorCode::kInvalidArgument, "token out-parameter is null");
  }
  for (const auto& op : ops) {
    if (auto error = ValidateGraphOp(op); !error.empty()) {
      return StoreStatus::Err(StoreErrorCode::kInvalidArgument, error);
    }
  }
  if (util::Expired(deadline)) {
    return StoreStatus::Err(StoreErrorCode::kDeadlineExceeded, "graph prepare");
  }

  std::unique_lock lock(mutex_);
  *token          = util::NewId();
  staged_[*token] = ops;
  return StoreStatus::Ok();
}

StoreStatus MemoryGraphStore::Commit(const StagingToken& token, util::Deadline deadline) {
  std::unique_lock lock(mutex_);

  auto it = staged_.find(token);
  if (it == staged_.end()) {
    return StoreStatus::Err(StoreErrorCode::kNotFound, "unknown staging token " + token);
  }
  // leave the stage in place so the caller can still discard it
  if (util::Expired(deadline)) {
    return StoreStatus::Err(StoreErrorCode::kDeadlineExceeded, "graph commit");
  }

  for (const auto& op : it->second) {
    if (const auto* node = std::get_if<GraphNodeUpsert>(&op)) {
      MergeNode(nodes_[node->id], *node);
    } else {
      edges_.insert(std::get<GraphRelationshipUpsert>(op).relationship);
    }
  }

  staged_.erase(it);
  return StoreStatus::Ok();
}

StoreStatus MemoryGraphStore::Discard(const StagingToken& token) {
  std::unique_lock lock(mutex_);
  staged_.erase(token);
  return StoreStatus::Ok();
}

std::optional<model::GraphNode> MemoryGraphStore::FindNode(const model::EntityIdentifier& id) {
  std::shared_lock lock(mutex_);

  auto it = nodes_.find(id);
  if (it == nodes_.end()) return std::nullopt;
  return it->second;
}

std::vector<model::Relationship> MemoryGraphStore::FindRelationships(const model::EntityIdentifier& source_id) {
  std::shared_lock lock(mutex_);

  std::vector<model::Relationship> out;
  // edges_ is ordered by source first
  for (auto it = edges_.lower_bound(model::Relationship{source_id, "", ""}); it != edges_.end() && it->source_id == source_id; ++it) {
    out.push_back(*it);
  }
  return out;
}

std::size_t MemoryGraphStore::NodeCount() const {
  std::shared_lock lock(mutex_);
  return nodes_.size();
}

std::size_t MemoryGraphStore::EdgeCount() const {
  std::shared_lock lock(mutex_);
  return edges_.size();
}

std::size_t MemoryGraphStore::StagedCount() const {
  std::shared_lock lock(mutex_);
  return staged_.size();
}

} // namespace storykb::store::memory

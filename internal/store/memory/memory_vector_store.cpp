#include "memory_vector_store.hpp"

#include <mutex>

#include "internal/store/merge.hpp"
#include "internal/util/uuid.hpp"

namespace storykb::store::memory {

StoreStatus MemoryVectorStore::PrepareUpsert(const VectorUpsert& upsert, util::Deadline deadline, StagingToken* token) {
  if (token == nullptr) {
    return StoreStatus::Err(StoreErrorCode::kInvalidArgument, "token out-parameter is null");
  }
  if (auto error = ValidateVectorUpsert(upsert); !error.empty()) {
    return StoreStatus::Err(StoreErrorCode::kInvalidArgument, error);
  }
  if (util::Expired(deadline)) {
    return StoreStatus::Err(StoreErrorCode::kDeadlineExceeded, "vector prepare");
  }

  std::unique_lock lock(mutex_);
  *token          = util::NewId();
  staged_[*token] = upsert;
  return StoreStatus::Ok();
}

StoreStatus MemoryVectorStore::Commit(const StagingToken& token, util::Deadline deadline) {
  std::unique_lock lock(mutex_);

  auto it = staged_.find(token);
  if (it == staged_.end()) {
    return StoreStatus::Err(StoreErrorCode::kNotFound, "unknown staging token " + token);
  }
  if (util::Expired(deadline)) {
    return StoreStatus::Err(StoreErrorCode::kDeadlineExceeded, "vector commit");
  }

  MergeEntry(entries_[it->second.id], it->second);
  staged_.erase(it);
  return StoreStatus::Ok();
}

StoreStatus MemoryVectorStore::Discard(const StagingToken& token) {
  std::unique_lock lock(mutex_);
  staged_.erase(token);
  return StoreStatus::Ok();
}

std::optional<model::VectorEntry> MemoryVectorStore::FindEntry(const model::EntityIdentifier& id) {
  std::shared_lock lock(mutex_);

  auto it = entries_.find(id);
  if (it == entries_.end()) return std::nullopt;
  return it->second;
}

std::size_t MemoryVectorStore::EntryCount() const {
  std::shared_lock lock(mutex_);
  return entries_.size();
}

std::size_t MemoryVectorStore::StagedCount() const {
  std::shared_lock lock(mutex_);
  return staged_.size();
}

} // namespace storykb::store::memory

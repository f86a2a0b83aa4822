#pragma once

#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "internal/store/vector_store_adapter.hpp"

namespace storykb::store::memory {

/*
  In-process vector store. Content is kept verbatim; no embedding is
  computed.
*/
class MemoryVectorStore final : public VectorStoreAdapter {
 public:
  MemoryVectorStore() = default;
  ~MemoryVectorStore() override = default;

  std::string_view Name() const override {
    return "vector";
  }

  StoreStatus PrepareUpsert(const VectorUpsert& upsert, util::Deadline deadline, StagingToken* token) override;
  StoreStatus Commit(const StagingToken& token, util::Deadline deadline) override;
  StoreStatus Discard(const StagingToken& token) override;

  std::optional<model::VectorEntry> FindEntry(const model::EntityIdentifier& id) override;

  std::size_t EntryCount() const;
  std::size_t StagedCount() const;

 private:
  mutable std::shared_mutex mutex_;

  std::unordered_map<model::EntityIdentifier, model::VectorEntry> entries_;
  std::unordered_map<StagingToken, VectorUpsert>                  staged_;
};

} // namespace storykb::store::memory

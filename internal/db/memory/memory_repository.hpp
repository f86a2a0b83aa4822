#pragma once

#include <cstdint>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace storykb::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertIdentity(Transaction&, const model::IdentityRecord&) override;
  std::optional<model::IdentityRecord> GetIdentityByKey(Transaction&, const std::string& natural_key) override;
  std::optional<model::IdentityRecord> GetIdentityById(Transaction&, const std::string& entity_id) override;

  Result AppendChangeEvent(Transaction&, model::ChangeEventRecord& record) override;
  std::optional<model::ChangeEventRecord> GetLatestChangeEvent(Transaction&, const std::string& transaction_id) override;
  std::vector<model::ChangeEventRecord> ListChangeEventsByEntity(Transaction&, const std::string& entity_id) override;
  std::vector<model::ChangeEventRecord> ListChangeEventsByTransaction(Transaction&, const std::string& transaction_id) override;
  std::vector<model::ChangeEventRecord> ListLatestByStatus(Transaction&, model::ChangeStatus status, std::size_t limit) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::IdentityRecord> identities; // by natural key
    std::unordered_map<std::string, std::string> key_by_entity;

    std::vector<model::ChangeEventRecord> events; // append order
    std::unordered_map<std::string, std::vector<std::size_t>> events_by_transaction;
    uint64_t next_sequence = 1;
  };

  std::mutex mutex_;
  State committed_;
  uint64_t committed_version_ = 0;
};

}

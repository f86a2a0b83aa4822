#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace storykb::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::InsertIdentity(Transaction& t, const model::IdentityRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.identities.contains(r.natural_key)) return Result::Err(ErrorCode::AlreadyExists, "natural key already mapped");
  if (s.key_by_entity.contains(r.entity_id)) return Result::Err(ErrorCode::AlreadyExists, "entity id already assigned");
  s.identities[r.natural_key]    = r;
  s.key_by_entity[r.entity_id]   = r.natural_key;
  return Result::Ok();
}

std::optional<model::IdentityRecord> MemoryRepository::GetIdentityByKey(Transaction& t, const std::string& natural_key) {
  const auto& s  = TX(t).View();
  auto        it = s.identities.find(natural_key);
  if (it == s.identities.end()) return std::nullopt;
  return it->second;
}

std::optional<model::IdentityRecord> MemoryRepository::GetIdentityById(Transaction& t, const std::string& entity_id) {
  const auto& s      = TX(t).View();
  auto        key_it = s.key_by_entity.find(entity_id);
  if (key_it == s.key_by_entity.end()) return std::nullopt;
  return s.identities.at(key_it->second);
}

Result MemoryRepository::AppendChangeEvent(Transaction& t, model::ChangeEventRecord& record) {
  auto& s         = TX(t).Mutable();
  record.sequence = s.next_sequence++;
  s.events_by_transaction[record.transaction_id].push_back(s.events.size());
  s.events.push_back(record);
  return Result::Ok();
}

std::optional<model::ChangeEventRecord> MemoryRepository::GetLatestChangeEvent(Transaction& t, const std::string& transaction_id) {
  const auto& s  = TX(t).View();
  auto        it = s.events_by_transaction.find(transaction_id);
  if (it == s.events_by_transaction.end() || it->second.empty()) return std::nullopt;
  return s.events[it->second.back()];
}

std::vector<model::ChangeEventRecord> MemoryRepository::ListChangeEventsByEntity(Transaction& t, const std::string& entity_id) {
  std::vector<model::ChangeEventRecord> out;
  for (const auto& e : TX(t).View().events)
    if (e.entity_id == entity_id) out.push_back(e);
  return out;
}

std::vector<model::ChangeEventRecord> MemoryRepository::ListChangeEventsByTransaction(Transaction& t, const std::string& transaction_id) {
  const auto&                           s = TX(t).View();
  std::vector<model::ChangeEventRecord> out;
  auto                                  it = s.events_by_transaction.find(transaction_id);
  if (it == s.events_by_transaction.end()) return out;
  for (const auto index : it->second)
    out.push_back(s.events[index]);
  return out;
}

std::vector<model::ChangeEventRecord> MemoryRepository::ListLatestByStatus(Transaction& t, model::ChangeStatus status, std::size_t limit) {
  const auto&                           s = TX(t).View();
  std::vector<model::ChangeEventRecord> out;
  for (const auto& [_, indexes] : s.events_by_transaction) {
    const auto& latest = s.events[indexes.back()];
    if (latest.status == status) out.push_back(latest);
  }

  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.sequence < b.sequence; });
  if (limit > 0 && out.size() > limit) out.resize(limit);
  return out;
}

} // namespace storykb::db::memory

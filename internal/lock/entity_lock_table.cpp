#include "entity_lock_table.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace storykb::lock {

EntityLockTable::Guard::Guard(EntityLockTable* table, std::string entity_id) : table_(table), entity_id_(std::move(entity_id)) {
}

EntityLockTable::Guard::~Guard() {
  Release();
}

EntityLockTable::Guard::Guard(Guard&& other) noexcept : table_(other.table_), entity_id_(std::move(other.entity_id_)) {
  other.table_ = nullptr;
}

EntityLockTable::Guard& EntityLockTable::Guard::operator=(Guard&& other) noexcept {
  if (this != &other) {
    Release();
    table_       = other.table_;
    entity_id_   = std::move(other.entity_id_);
    other.table_ = nullptr;
  }
  return *this;
}

void EntityLockTable::Guard::Release() {
  if (table_) {
    table_->Unlock(entity_id_);
    table_ = nullptr;
  }
}

EntityLockTable::Guard EntityLockTable::Acquire(const std::string& entity_id, ConflictPolicy policy, std::chrono::milliseconds wait_timeout) {
  std::unique_lock lock(mutex_);
  auto&            entry = entries_[entity_id];

  if (!entry.held && entry.waiters.empty()) {
    entry.held = true;
    return Guard(this, entity_id);
  }

  if (policy == ConflictPolicy::kFailFast) {
    throw util::ConcurrencyConflict(entity_id, "entity is locked by another transaction");
  }

  const auto ticket = next_ticket_++;
  entry.waiters.push_back(ticket);

  const auto deadline = std::chrono::steady_clock::now() + wait_timeout;
  // entries_ may rehash while we sleep, so look the entry up again on wake
  const bool acquired = cv_.wait_until(lock, deadline, [&] {
    const auto& e = entries_[entity_id];
    return !e.held && !e.waiters.empty() && e.waiters.front() == ticket;
  });

  auto& current = entries_[entity_id];
  if (!acquired) {
    current.waiters.erase(std::remove(current.waiters.begin(), current.waiters.end(), ticket), current.waiters.end());
    if (!current.held && current.waiters.empty()) {
      entries_.erase(entity_id);
    }
    // the next waiter may be at the front now
    cv_.notify_all();
    throw util::ConcurrencyConflict(entity_id, "timed out waiting for entity lock after " + std::to_string(wait_timeout.count()) + "ms");
  }

  current.waiters.pop_front();
  current.held = true;
  return Guard(this, entity_id);
}

void EntityLockTable::Unlock(const std::string& entity_id) {
  {
    std::lock_guard lock(mutex_);
    auto            it = entries_.find(entity_id);
    if (it == entries_.end()) return;

    it->second.held = false;
    if (it->second.waiters.empty()) {
      entries_.erase(it);
    }
  }
  cv_.notify_all();
}

bool EntityLockTable::IsLocked(const std::string& entity_id) const {
  std::lock_guard lock(mutex_);
  auto            it = entries_.find(entity_id);
  return it != entries_.end() && it->second.held;
}

std::size_t EntityLockTable::WaiterCount(const std::string& entity_id) const {
  std::lock_guard lock(mutex_);
  auto            it = entries_.find(entity_id);
  return it == entries_.end() ? 0 : it->second.waiters.size();
}

} // namespace storykb::lock

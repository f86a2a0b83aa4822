#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_map>

namespace storykb::lock {

enum class ConflictPolicy {
  kFailFast,
  kWait,
};

/*
  Exclusive write lock per entity.

  FAIL_FAST throws ConcurrencyConflict when the entity is held or has
  waiters. WAIT queues the caller FIFO and throws ConcurrencyConflict when
  the timeout passes first. Different entities never contend.

  The table must outlive every Guard it hands out.
*/
class EntityLockTable {
 public:
  class Guard {
   public:
    Guard() = default;
    ~Guard();

    Guard(const Guard&)            = delete;
    Guard& operator=(const Guard&) = delete;

    Guard(Guard&& other) noexcept;
    Guard& operator=(Guard&& other) noexcept;

    void Release();

    bool Owns() const {
      return table_ != nullptr;
    }
    const std::string& EntityId() const {
      return entity_id_;
    }

   private:
    friend class EntityLockTable;
    Guard(EntityLockTable* table, std::string entity_id);

    EntityLockTable* table_ = nullptr;
    std::string      entity_id_;
  };

  Guard Acquire(const std::string& entity_id, ConflictPolicy policy, std::chrono::milliseconds wait_timeout);

  bool        IsLocked(const std::string& entity_id) const;
  std::size_t WaiterCount(const std::string& entity_id) const;

 private:
  struct Entry {
    bool                       held = false;
    std::deque<std::uint64_t>  waiters;
  };

  void Unlock(const std::string& entity_id);

  mutable std::mutex                     mutex_;
  std::condition_variable                cv_;
  std::unordered_map<std::string, Entry> entries_;
  std::uint64_t                          next_ticket_ = 0;
};

} // namespace storykb::lock

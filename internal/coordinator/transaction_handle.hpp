#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/lock/entity_lock_table.hpp"
#include "internal/model/change_event.hpp"
#include "internal/model/story_element.hpp"
#include "internal/model/transaction_state.hpp"
#include "internal/store/graph_store_adapter.hpp"
#include "internal/store/vector_store_adapter.hpp"

namespace storykb::coordinator {

class TransactionCoordinator;

/*
  One in-flight dual-store write, exclusively owned by its caller.

  Holds the entity write lock from Begin until the transaction reaches a
  terminal state. Every coordinator call on a terminal handle throws
  InvalidState. A handle dropped before reaching a terminal state discards
  whatever it staged and releases the lock.

  A handle must not outlive the coordinator that issued it.
*/
class TransactionHandle {
 public:
  ~TransactionHandle();

  TransactionHandle(const TransactionHandle&)            = delete;
  TransactionHandle& operator=(const TransactionHandle&) = delete;

  const std::string& TransactionId() const {
    return transaction_id_;
  }
  const model::EntityIdentifier& EntityId() const {
    return entity_id_;
  }
  model::ChangeType Type() const {
    return change_type_;
  }
  model::TransactionState State() const {
    return state_;
  }

  const std::optional<store::VectorUpsert>& StagedVectorOp() const {
    return vector_op_;
  }
  const std::vector<store::GraphOp>& StagedGraphOps() const {
    return graph_ops_;
  }

  bool HoldsLock() const {
    return lock_.Owns();
  }

 private:
  friend class TransactionCoordinator;

  TransactionHandle(TransactionCoordinator* coordinator, std::string transaction_id, model::EntityIdentifier entity_id,
                    model::ChangeType change_type, lock::EntityLockTable::Guard lock);

  TransactionCoordinator* coordinator_;

  std::string             transaction_id_;
  model::EntityIdentifier entity_id_;
  model::ChangeType       change_type_;
  model::TransactionState state_ = model::TransactionState::kInit;

  std::optional<store::VectorUpsert> vector_op_;
  std::vector<store::GraphOp>        graph_ops_;

  std::optional<store::StagingToken> graph_token_;
  std::optional<store::StagingToken> vector_token_;

  lock::EntityLockTable::Guard lock_;
  bool                         pending_recorded_ = false;
};

} // namespace storykb::coordinator

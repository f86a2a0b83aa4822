#include "transaction_handle.hpp"

#include "internal/coordinator/transaction_coordinator.hpp"

namespace storykb::coordinator {

TransactionHandle::TransactionHandle(TransactionCoordinator* coordinator, std::string transaction_id, model::EntityIdentifier entity_id,
                                     model::ChangeType change_type, lock::EntityLockTable::Guard lock)
    : coordinator_(coordinator),
      transaction_id_(std::move(transaction_id)),
      entity_id_(std::move(entity_id)),
      change_type_(change_type),
      lock_(std::move(lock)) {
}

TransactionHandle::~TransactionHandle() {
  if (coordinator_ && !model::IsTerminal(state_)) {
    coordinator_->Abandon(*this);
  }
}

} // namespace storykb::coordinator

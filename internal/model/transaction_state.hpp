#pragma once

#include <cstdint>
#include <string_view>

namespace storykb::model {

enum class TransactionState : std::uint8_t {
  kInit               = 0,
  kStaging            = 1,
  kPreparing          = 2,
  kPrepared           = 3,
  kCommitting         = 4,
  kAborting           = 5,
  kCommitted          = 6,
  kRolledBack         = 7,
  kPartiallyCommitted = 8,
};

constexpr bool IsTerminal(TransactionState state) {
  return state == TransactionState::kCommitted || state == TransactionState::kRolledBack || state == TransactionState::kPartiallyCommitted;
}

/*
  INIT -> STAGING -> PREPARING -> PREPARED -> COMMITTING -> COMMITTED
                         |            |            |-> PARTIALLY_COMMITTED
                         |            |            '-> ABORTING (first side failed)
                         '------------+-> ABORTING -> ROLLED_BACK | PARTIALLY_COMMITTED

  STAGING may go straight to ABORTING on an explicit rollback.
  ABORTING ends in PARTIALLY_COMMITTED only when a stage cannot be discarded.
*/
constexpr bool CanTransition(TransactionState from, TransactionState to) {
  if (IsTerminal(from)) {
    return false;
  }

  switch (from) {
    case TransactionState::kInit:
      return to == TransactionState::kStaging;
    case TransactionState::kStaging:
      return to == TransactionState::kPreparing || to == TransactionState::kAborting;
    case TransactionState::kPreparing:
      return to == TransactionState::kPrepared || to == TransactionState::kAborting;
    case TransactionState::kPrepared:
      return to == TransactionState::kCommitting || to == TransactionState::kAborting;
    case TransactionState::kCommitting:
      return to == TransactionState::kCommitted || to == TransactionState::kPartiallyCommitted || to == TransactionState::kAborting;
    case TransactionState::kAborting:
      return to == TransactionState::kRolledBack || to == TransactionState::kPartiallyCommitted;
    default:
      return false;
  }
}

constexpr std::string_view ToString(TransactionState state) {
  switch (state) {
    case TransactionState::kInit:
      return "INIT";
    case TransactionState::kStaging:
      return "STAGING";
    case TransactionState::kPreparing:
      return "PREPARING";
    case TransactionState::kPrepared:
      return "PREPARED";
    case TransactionState::kCommitting:
      return "COMMITTING";
    case TransactionState::kAborting:
      return "ABORTING";
    case TransactionState::kCommitted:
      return "COMMITTED";
    case TransactionState::kRolledBack:
      return "ROLLED_BACK";
    case TransactionState::kPartiallyCommitted:
      return "PARTIALLY_COMMITTED";
  }
  return "UNKNOWN";
}

} // namespace storykb::model

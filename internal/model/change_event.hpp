#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace storykb::model {

enum class ChangeType : std::uint8_t {
  kContent      = 1,
  kRelationship = 2,
  kMetadata     = 3,
};

enum class ChangeStatus : std::uint8_t {
  kPending                = 1,
  kCommitted              = 2,
  kFailed                 = 3,
  kRolledBack             = 4,
  kReconciliationRequired = 5,
};

constexpr bool IsTerminal(ChangeStatus status) {
  return status == ChangeStatus::kCommitted || status == ChangeStatus::kRolledBack || status == ChangeStatus::kFailed;
}

/*
  Monotonic status transitions for the records of one transaction.

    pending -> committed | failed | rolled_back | reconciliation_required
    reconciliation_required -> committed | rolled_back | failed

  failed after reconciliation_required means the repair can never succeed.

  committed, failed and rolled_back never change again.
*/
constexpr bool CanTransition(ChangeStatus from, ChangeStatus to) {
  if (IsTerminal(from)) {
    return false;
  }
  if (to == ChangeStatus::kPending) {
    return false;
  }
  if (from == ChangeStatus::kReconciliationRequired) {
    return to == ChangeStatus::kCommitted || to == ChangeStatus::kRolledBack || to == ChangeStatus::kFailed;
  }
  return true;
}

constexpr std::string_view ToString(ChangeType type) {
  switch (type) {
    case ChangeType::kContent:
      return "content";
    case ChangeType::kRelationship:
      return "relationship";
    case ChangeType::kMetadata:
      return "metadata";
  }
  return "unknown";
}

constexpr std::string_view ToString(ChangeStatus status) {
  switch (status) {
    case ChangeStatus::kPending:
      return "pending";
    case ChangeStatus::kCommitted:
      return "committed";
    case ChangeStatus::kFailed:
      return "failed";
    case ChangeStatus::kRolledBack:
      return "rolled_back";
    case ChangeStatus::kReconciliationRequired:
      return "reconciliation_required";
  }
  return "unknown";
}

std::optional<ChangeType>   ParseChangeType(std::string_view value);
std::optional<ChangeStatus> ParseChangeStatus(std::string_view value);

/*
  One ledger record. Records are appended, never rewritten; the status of a
  transaction is the status of its latest record.
*/
struct ChangeEvent {
  std::uint64_t sequence = 0; // assigned by the ledger

  std::string   transaction_id;
  std::string   entity_id;
  std::uint64_t timestamp_ms = 0;

  ChangeType   change_type = ChangeType::kContent;
  ChangeStatus status      = ChangeStatus::kPending;

  // JSON encoded storykb.ledger.v1.ChangePayload
  std::string payload;

  std::string phase;   // "prepare", "commit", "rollback", "reconcile"
  std::string adapter; // offending or completing adapter, empty when none
  std::string detail;
};

} // namespace storykb::model

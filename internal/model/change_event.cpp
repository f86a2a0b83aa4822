#include "change_event.hpp"

namespace storykb::model {

std::optional<ChangeType> ParseChangeType(std::string_view value) {
  for (auto type : {ChangeType::kContent, ChangeType::kRelationship, ChangeType::kMetadata}) {
    if (ToString(type) == value) return type;
  }
  return std::nullopt;
}

std::optional<ChangeStatus> ParseChangeStatus(std::string_view value) {
  for (auto status : {ChangeStatus::kPending, ChangeStatus::kCommitted, ChangeStatus::kFailed, ChangeStatus::kRolledBack,
                      ChangeStatus::kReconciliationRequired}) {
    if (ToString(status) == value) return status;
  }
  return std::nullopt;
}

} // namespace storykb::model

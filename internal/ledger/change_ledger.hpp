#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/change_event.hpp"

namespace storykb::ledger {

/*
  Append-only audit log of change events.

  Every record of a transaction is a new row; the status of a transaction
  is the status of its latest row. Record() checks the transition against
  that latest row and throws InvalidState on a violation, so a transaction
  can never go backwards or leave a terminal status.
*/
class ChangeLedger {
 public:
  explicit ChangeLedger(std::shared_ptr<db::Repository> repository);

  // Returns the stored event with its sequence and timestamp filled in.
  model::ChangeEvent Record(model::ChangeEvent event);

  // All records of an entity in append order.
  std::vector<model::ChangeEvent> History(const std::string& entity_id);

  // All records of a transaction in append order.
  std::vector<model::ChangeEvent> Transaction(const std::string& transaction_id);

  std::optional<model::ChangeEvent> Latest(const std::string& transaction_id);

  // Transactions whose latest record is reconciliation_required, oldest
  // first. limit == 0 returns all of them.
  std::vector<model::ChangeEvent> PendingReconciliation(std::size_t limit);

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace storykb::ledger

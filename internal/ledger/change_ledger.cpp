#include "change_ledger.hpp"

#include <stdexcept>

#include "internal/db/api/transaction_runner.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace storykb::ledger {

namespace {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::Busy:
    case db::ErrorCode::Conflict:
    case db::ErrorCode::SerializationFailure:
      throw util::TransientStoreError(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace

ChangeLedger::ChangeLedger(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
  if (!repository_) {
    throw std::invalid_argument("ChangeLedger: repository is null");
  }
}

model::ChangeEvent ChangeLedger::Record(model::ChangeEvent event) {
  if (event.transaction_id.empty()) {
    throw util::ValidationError("record change: transaction_id must not be empty");
  }
  if (event.entity_id.empty()) {
    throw util::ValidationError("record change: entity_id must not be empty");
  }
  if (event.timestamp_ms == 0) {
    event.timestamp_ms = util::NowMillis();
  }

  return db::RunInTransaction(*repository_, "record change", [&](db::Transaction& tx) {
    auto record   = event;
    auto previous = repository_->GetLatestChangeEvent(tx, record.transaction_id);

    if (!previous) {
      if (record.status != model::ChangeStatus::kPending) {
        throw util::InvalidState("record change: first record of transaction " + record.transaction_id + " must be pending, got " +
                                 std::string(model::ToString(record.status)));
      }
    } else {
      if (previous->entity_id != record.entity_id) {
        throw util::ValidationError("record change: transaction " + record.transaction_id + " belongs to entity " + previous->entity_id);
      }
      if (!model::CanTransition(previous->status, record.status)) {
        throw util::InvalidState("record change: transaction " + record.transaction_id + " cannot move from " +
                                 std::string(model::ToString(previous->status)) + " to " + std::string(model::ToString(record.status)));
      }
    }

    ThrowIfDbError(repository_->AppendChangeEvent(tx, record), "record change");
    return record;
  });
}

std::vector<model::ChangeEvent> ChangeLedger::History(const std::string& entity_id) {
  return db::RunInTransaction(*repository_, "ledger history",
                              [&](db::Transaction& tx) { return repository_->ListChangeEventsByEntity(tx, entity_id); });
}

std::vector<model::ChangeEvent> ChangeLedger::Transaction(const std::string& transaction_id) {
  return db::RunInTransaction(*repository_, "ledger transaction",
                              [&](db::Transaction& tx) { return repository_->ListChangeEventsByTransaction(tx, transaction_id); });
}

std::optional<model::ChangeEvent> ChangeLedger::Latest(const std::string& transaction_id) {
  return db::RunInTransaction(*repository_, "ledger latest",
                              [&](db::Transaction& tx) { return repository_->GetLatestChangeEvent(tx, transaction_id); });
}

std::vector<model::ChangeEvent> ChangeLedger::PendingReconciliation(std::size_t limit) {
  return db::RunInTransaction(*repository_, "pending reconciliation", [&](db::Transaction& tx) {
    return repository_->ListLatestByStatus(tx, model::ChangeStatus::kReconciliationRequired, limit);
  });
}

} // namespace storykb::ledger

#include "reconciliation_sweeper.hpp"

#include <stdexcept>

#include "internal/ledger/change_payload_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace storykb::reconcile {

using observability::StringField;
using storykb::ledger::v1::ChangePayload;
using store::StoreStatus;

namespace {

store::VectorUpsert VectorUpsertFrom(const ChangePayload& payload) {
  store::VectorUpsert upsert;
  upsert.id      = payload.entity_id();
  upsert.content = payload.content();
  for (const auto& [key, value] : payload.metadata()) {
    upsert.metadata[key] = value;
  }
  return upsert;
}

} // namespace

ReconciliationSweeper::ReconciliationSweeper(std::shared_ptr<ledger::ChangeLedger> ledger, std::shared_ptr<store::GraphStoreAdapter> graph,
                                             std::shared_ptr<store::VectorStoreAdapter>            vector,
                                             std::shared_ptr<coordinator::TransactionCoordinator> coordinator, SweeperOptions options)
    : ledger_(std::move(ledger)),
      graph_(std::move(graph)),
      vector_(std::move(vector)),
      coordinator_(std::move(coordinator)),
      options_(options) {
  if (!ledger_ || !graph_ || !vector_ || !coordinator_) {
    throw std::invalid_argument("ReconciliationSweeper: ledger, stores and coordinator are required");
  }
}

ReconciliationSweeper::~ReconciliationSweeper() {
  Stop();
}

void ReconciliationSweeper::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&ReconciliationSweeper::Loop, this);
}

void ReconciliationSweeper::Stop() {
  {
    std::lock_guard lock(wake_mutex_);
    running_ = false;
  }
  wake_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void ReconciliationSweeper::Loop() {
  while (running_) {
    try {
      SweepOnce();
    } catch (const std::exception& e) {
      // the ledger may be briefly unavailable; the next pass retries
      STORYKB_LOG_ERROR("reconciliation sweep failed", {StringField("error", e.what())});
    }

    std::unique_lock lock(wake_mutex_);
    wake_.wait_for(lock, options_.interval, [this] { return !running_; });
  }
}

SweepStats ReconciliationSweeper::SweepOnce() {
  observability::SpanScope span("storykb.reconcile.sweep");

  SweepStats stats;
  for (const auto& event : ledger_->PendingReconciliation(options_.batch_size)) {
    ++stats.examined;
    switch (Reconcile(event)) {
      case Outcome::kConverged:
        ++stats.converged;
        observability::Metrics::Instance().RecordReconciliation("converged");
        break;
      case Outcome::kSuperseded:
        ++stats.superseded;
        observability::Metrics::Instance().RecordReconciliation("superseded");
        break;
      case Outcome::kFailed:
        ++stats.failed;
        observability::Metrics::Instance().RecordReconciliation("failed");
        break;
      case Outcome::kUnrepairable:
        ++stats.unrepairable;
        observability::Metrics::Instance().RecordReconciliation("unrepairable");
        break;
      case Outcome::kSkipped:
        ++stats.skipped;
        break;
    }
  }

  span.SetAttribute("examined", static_cast<std::int64_t>(stats.examined));
  if (stats.examined > 0) {
    STORYKB_LOG_INFO("reconciliation sweep finished",
                     {observability::IntField("examined", static_cast<std::int64_t>(stats.examined)),
                      observability::IntField("converged", static_cast<std::int64_t>(stats.converged)),
                      observability::IntField("superseded", static_cast<std::int64_t>(stats.superseded)),
                      observability::IntField("failed", static_cast<std::int64_t>(stats.failed)),
                      observability::IntField("unrepairable", static_cast<std::int64_t>(stats.unrepairable)),
                      observability::IntField("skipped", static_cast<std::int64_t>(stats.skipped))});
  }
  return stats;
}

ReconciliationSweeper::Outcome ReconciliationSweeper::Reconcile(const model::ChangeEvent& event) {
  ChangePayload payload;
  try {
    payload = ledger::DecodePayload(event.payload);
  } catch (const util::ValidationError& e) {
    return CloseUnrepairable(event, std::string("payload unreadable: ") + e.what());
  }

  // a live transaction owns the entity; its own outcome may settle things
  lock::EntityLockTable::Guard guard;
  try {
    guard = coordinator_->Locks().Acquire(event.entity_id, lock::ConflictPolicy::kFailFast, std::chrono::milliseconds(0));
  } catch (const util::ConcurrencyConflict&) {
    return Outcome::kSkipped;
  }

  const auto deadline = util::DeadlineAfter(options_.operation_timeout);

  model::ChangeEvent close;
  close.transaction_id = event.transaction_id;
  close.entity_id      = event.entity_id;
  close.change_type    = event.change_type;
  close.payload        = event.payload;
  close.phase          = "reconcile";

  Outcome     outcome = Outcome::kConverged;
  StoreStatus status  = DiscardLeftovers(payload);

  switch (payload.action()) {
    case storykb::ledger::v1::RECONCILE_ACTION_COMPLETE_VECTOR_UPSERT: {
      if (!status) break;

      auto node = graph_->FindNode(event.entity_id);
      if (!payload.node_content_hash().empty() && node && node->content_hash != payload.node_content_hash()) {
        close.status = model::ChangeStatus::kCommitted;
        close.detail = "superseded: graph node now has content_hash " + node->content_hash;
        outcome      = Outcome::kSuperseded;
        break;
      }

      store::StagingToken token;
      status = vector_->PrepareUpsert(VectorUpsertFrom(payload), deadline, &token);
      if (!status) break;
      status = vector_->Commit(token, deadline);
      if (!status) {
        const auto discarded = vector_->Discard(token);
        if (!discarded) status.message += "; discard failed: " + discarded.ToString();
        break;
      }
      close.status  = model::ChangeStatus::kCommitted;
      close.adapter = std::string(vector_->Name());
      close.detail  = "vector upsert completed";
      break;
    }

    case storykb::ledger::v1::RECONCILE_ACTION_DISCARD_STAGE: {
      if (status && payload.leftover_stages().empty()) {
        status = StoreStatus::Err(store::StoreErrorCode::kInvalidArgument, "discard action lists no leftover stage");
      }
      if (!status) break;
      close.status  = model::ChangeStatus::kRolledBack;
      close.adapter = payload.failed_side();
      close.detail  = "leftover stages discarded: " + std::to_string(payload.leftover_stages_size());
      break;
    }

    default:
      status = StoreStatus::Err(store::StoreErrorCode::kInvalidArgument, "payload carries no reconcile action");
      break;
  }

  if (!status) {
    if (status.code == store::StoreErrorCode::kInvalidArgument) {
      return CloseUnrepairable(event, status.ToString());
    }
    STORYKB_LOG_WARN("reconciliation attempt failed",
                     {StringField("entity_id", event.entity_id), StringField("transaction_id", event.transaction_id),
                      StringField("action", storykb::ledger::v1::ReconcileAction_Name(payload.action())), StringField("error", status.ToString())});
    return Outcome::kFailed;
  }

  try {
    ledger_->Record(std::move(close));
  } catch (const util::InvalidState& e) {
    // another sweeper closed it first
    STORYKB_LOG_DEBUG("reconciliation already closed", {StringField("transaction_id", event.transaction_id), StringField("error", e.what())});
    return Outcome::kSkipped;
  }

  STORYKB_LOG_INFO("reconciliation closed", {StringField("entity_id", event.entity_id), StringField("transaction_id", event.transaction_id),
                                             StringField("action", storykb::ledger::v1::ReconcileAction_Name(payload.action()))});
  return outcome;
}

StoreStatus ReconciliationSweeper::DiscardLeftovers(const ChangePayload& payload) {
  for (const auto& stage : payload.leftover_stages()) {
    if (stage.adapter() != graph_->Name() && stage.adapter() != vector_->Name()) {
      return StoreStatus::Err(store::StoreErrorCode::kInvalidArgument, "unknown adapter '" + stage.adapter() + "'");
    }
  }

  // unknown tokens discard as OK, so a pass that stopped halfway can run again
  for (const auto& stage : payload.leftover_stages()) {
    const auto status = stage.adapter() == graph_->Name() ? graph_->Discard(stage.staging_token()) : vector_->Discard(stage.staging_token());
    if (!status) return status;
  }
  return StoreStatus::Ok();
}

ReconciliationSweeper::Outcome ReconciliationSweeper::CloseUnrepairable(const model::ChangeEvent& event, const std::string& reason) {
  STORYKB_LOG_ERROR("reconciliation abandoned", {StringField("entity_id", event.entity_id), StringField("transaction_id", event.transaction_id),
                                                 StringField("reason", reason)});

  model::ChangeEvent close;
  close.transaction_id = event.transaction_id;
  close.entity_id      = event.entity_id;
  close.change_type    = event.change_type;
  close.payload        = event.payload;
  close.status         = model::ChangeStatus::kFailed;
  close.phase          = "reconcile";
  close.adapter        = event.adapter;
  close.detail         = "unrepairable: " + reason;

  try {
    ledger_->Record(std::move(close));
  } catch (const util::InvalidState& e) {
    STORYKB_LOG_DEBUG("reconciliation already closed", {StringField("transaction_id", event.transaction_id), StringField("error", e.what())});
    return Outcome::kSkipped;
  }
  return Outcome::kUnrepairable;
}

} // namespace storykb::reconcile

#include "transaction_coordinator.hpp"

#include <stdexcept>
#include <string_view>

#include "internal/ledger/change_payload_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/store/merge.hpp"
#include "internal/util/content_hash.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace storykb::coordinator {

using model::TransactionState;
using observability::StringField;
using storykb::ledger::v1::ChangePayload;
using storykb::ledger::v1::ReconcileAction;
using store::StoreErrorCode;
using store::StoreStatus;

namespace {

double ElapsedMs(util::SteadyClock::time_point started) {
  return std::chrono::duration<double, std::milli>(util::SteadyClock::now() - started).count();
}

} // namespace

TransactionCoordinator::TransactionCoordinator(std::shared_ptr<store::GraphStoreAdapter> graph, std::shared_ptr<store::VectorStoreAdapter> vector,
                                               std::shared_ptr<ledger::ChangeLedger> ledger, CoordinatorOptions options)
    : graph_(std::move(graph)), vector_(std::move(vector)), ledger_(std::move(ledger)), options_(options) {
  if (!graph_ || !vector_ || !ledger_) {
    throw std::invalid_argument("TransactionCoordinator: graph, vector and ledger are required");
  }
}

// ------------------------------------------------------------------
// Begin / stage
// ------------------------------------------------------------------

std::unique_ptr<TransactionHandle> TransactionCoordinator::Begin(const model::EntityIdentifier& entity_id, model::ChangeType change_type) {
  if (!util::IsCanonicalUUID(entity_id)) {
    throw util::ValidationError("begin: entity_id is not a canonical identifier: '" + entity_id + "'");
  }

  lock::EntityLockTable::Guard guard;
  try {
    guard = locks_.Acquire(entity_id, options_.conflict_policy, options_.lock_wait_timeout);
  } catch (const util::ConcurrencyConflict& e) {
    observability::Metrics::Instance().RecordTransactionOutcome("conflict");
    STORYKB_LOG_WARN("entity lock not acquired", {StringField("entity_id", entity_id), StringField("error", e.what())});
    throw;
  }

  auto handle = std::unique_ptr<TransactionHandle>(new TransactionHandle(this, util::NewId(), entity_id, change_type, std::move(guard)));
  Transition(*handle, TransactionState::kStaging);
  return handle;
}

void TransactionCoordinator::StageVectorOp(TransactionHandle& handle, store::VectorUpsert op) {
  RequireState(handle, TransactionState::kStaging, "stage vector op");

  if (auto error = store::ValidateVectorUpsert(op); !error.empty()) {
    throw util::ValidationError("stage vector op: " + error);
  }
  if (op.id != handle.entity_id_) {
    throw util::ValidationError("stage vector op: upsert targets " + op.id + " but the transaction is for " + handle.entity_id_);
  }
  if (handle.vector_op_) {
    throw util::ValidationError("stage vector op: a vector upsert is already staged for " + handle.entity_id_);
  }
  handle.vector_op_ = std::move(op);
}

void TransactionCoordinator::StageGraphOp(TransactionHandle& handle, store::GraphOp op) {
  RequireState(handle, TransactionState::kStaging, "stage graph op");

  if (auto error = store::ValidateGraphOp(op); !error.empty()) {
    throw util::ValidationError("stage graph op: " + error);
  }

  // only the primary entity is written; other entities may only appear as edge targets
  const auto& owner = std::holds_alternative<store::GraphNodeUpsert>(op) ? std::get<store::GraphNodeUpsert>(op).id
                                                                         : std::get<store::GraphRelationshipUpsert>(op).relationship.source_id;
  if (owner != handle.entity_id_) {
    throw util::ValidationError("stage graph op: op targets " + owner + " but the transaction is for " + handle.entity_id_);
  }
  handle.graph_ops_.push_back(std::move(op));
}

// ------------------------------------------------------------------
// Prepare
// ------------------------------------------------------------------

void TransactionCoordinator::Prepare(TransactionHandle& handle, util::Deadline deadline) {
  RequireState(handle, TransactionState::kStaging, "prepare");
  if (!handle.vector_op_ && handle.graph_ops_.empty()) {
    throw util::ValidationError("prepare: nothing staged for " + handle.entity_id_);
  }

  observability::SpanScope span("storykb.coordinator.prepare");
  span.SetAttribute("entity_id", handle.entity_id_);
  span.SetAttribute("transaction_id", handle.transaction_id_);
  const auto started = util::SteadyClock::now();

  Transition(handle, TransactionState::kPreparing);
  try {
    EnsurePendingRecorded(handle);
  } catch (const std::exception& e) {
    // nothing staged yet, so there is nothing to undo in the stores
    Transition(handle, TransactionState::kAborting);
    Transition(handle, TransactionState::kRolledBack);
    Finish(handle);
    span.RecordException(e.what());
    throw;
  }

  if (!handle.graph_ops_.empty()) {
    store::StagingToken token;
    std::uint32_t       attempts = 0;
    const auto          status   = RunWithRetry(
        options_.retry, deadline,
        [&] {
          if (util::Expired(deadline)) return StoreStatus::Err(StoreErrorCode::kDeadlineExceeded, "prepare deadline passed");
          return graph_->PrepareWrite(handle.graph_ops_, deadline, &token);
        },
        &attempts);
    if (!status) {
      span.RecordException(status.ToString());
      AbortAndThrow(handle, "prepare", std::string(graph_->Name()), status.ToString() + " attempts=" + std::to_string(attempts));
    }
    handle.graph_token_ = std::move(token);
  }

  if (handle.vector_op_) {
    store::StagingToken token;
    std::uint32_t       attempts = 0;
    const auto          status   = RunWithRetry(
        options_.retry, deadline,
        [&] {
          if (util::Expired(deadline)) return StoreStatus::Err(StoreErrorCode::kDeadlineExceeded, "prepare deadline passed");
          return vector_->PrepareUpsert(*handle.vector_op_, deadline, &token);
        },
        &attempts);
    if (!status) {
      span.RecordException(status.ToString());
      AbortAndThrow(handle, "prepare", std::string(vector_->Name()), status.ToString() + " attempts=" + std::to_string(attempts));
    }
    handle.vector_token_ = std::move(token);
  }

  Transition(handle, TransactionState::kPrepared);
  observability::Metrics::Instance().ObservePhaseLatencyMs("prepare", ElapsedMs(started));
}

// ------------------------------------------------------------------
// Commit
// ------------------------------------------------------------------

void TransactionCoordinator::Commit(TransactionHandle& handle, util::Deadline deadline) {
  RequireState(handle, TransactionState::kPrepared, "commit");

  observability::SpanScope span("storykb.coordinator.commit");
  span.SetAttribute("entity_id", handle.entity_id_);
  span.SetAttribute("transaction_id", handle.transaction_id_);
  const auto started = util::SteadyClock::now();

  Transition(handle, TransactionState::kCommitting);

  bool graph_committed = false;
  if (handle.graph_token_) {
    const auto status = util::Expired(deadline) ? StoreStatus::Err(StoreErrorCode::kDeadlineExceeded, "commit deadline passed before graph commit")
                                                : graph_->Commit(*handle.graph_token_, deadline);
    if (!status) {
      span.RecordException(status.ToString());
      AbortAndThrow(handle, "commit", std::string(graph_->Name()), status.ToString());
    }
    handle.graph_token_.reset();
    graph_committed = true;
  }

  if (handle.vector_token_) {
    const auto status = util::Expired(deadline) ? StoreStatus::Err(StoreErrorCode::kDeadlineExceeded, "commit deadline passed before vector commit")
                                                : vector_->Commit(*handle.vector_token_, deadline);
    if (!status) {
      span.RecordException(status.ToString());
      if (!graph_committed) {
        AbortAndThrow(handle, "commit", std::string(vector_->Name()), status.ToString());
      }

      // the graph side is visible and stays; the vector stage can never be applied now
      auto                       detail    = status.ToString();
      const auto                 token     = *handle.vector_token_;
      const auto                 discarded = vector_->Discard(token);
      std::vector<LeftoverStage> leftovers;
      if (!discarded) {
        detail += "; vector discard failed: " + discarded.ToString();
        leftovers.push_back({std::string(vector_->Name()), token});
      }
      handle.vector_token_.reset();
      PartialCommitAndThrow(handle, "commit", std::string(graph_->Name()), std::string(vector_->Name()), detail,
                            storykb::ledger::v1::RECONCILE_ACTION_COMPLETE_VECTOR_UPSERT, leftovers);
    }
    handle.vector_token_.reset();
  }

  Transition(handle, TransactionState::kCommitted);
  observability::Metrics::Instance().ObservePhaseLatencyMs("commit", ElapsedMs(started));
  observability::Metrics::Instance().RecordTransactionOutcome("committed");

  Append(handle, model::ChangeStatus::kCommitted, "commit", "", "", BuildPayload(handle));
  Finish(handle);
}

// ------------------------------------------------------------------
// Rollback
// ------------------------------------------------------------------

void TransactionCoordinator::Rollback(TransactionHandle& handle) {
  if (model::IsTerminal(handle.state_)) {
    throw util::InvalidState("rollback: transaction " + handle.transaction_id_ + " already finished as " +
                             std::string(model::ToString(handle.state_)));
  }
  if (handle.state_ != TransactionState::kStaging && handle.state_ != TransactionState::kPrepared) {
    throw util::InvalidState("rollback: only valid in STAGING or PREPARED, transaction " + handle.transaction_id_ + " is " +
                             std::string(model::ToString(handle.state_)));
  }

  observability::SpanScope span("storykb.coordinator.rollback");
  span.SetAttribute("entity_id", handle.entity_id_);
  span.SetAttribute("transaction_id", handle.transaction_id_);
  const auto started = util::SteadyClock::now();

  CompleteRollback(handle, "rollback", "", "rollback requested");
  observability::Metrics::Instance().ObservePhaseLatencyMs("rollback", ElapsedMs(started));
}

// ------------------------------------------------------------------
// Internals
// ------------------------------------------------------------------

void TransactionCoordinator::RequireState(const TransactionHandle& handle, TransactionState expected, const char* operation) const {
  if (model::IsTerminal(handle.state_)) {
    throw util::InvalidState(std::string(operation) + ": transaction " + handle.transaction_id_ + " already finished as " +
                             std::string(model::ToString(handle.state_)));
  }
  if (handle.state_ != expected) {
    throw util::InvalidState(std::string(operation) + ": requires " + std::string(model::ToString(expected)) + ", transaction " +
                             handle.transaction_id_ + " is " + std::string(model::ToString(handle.state_)));
  }
}

void TransactionCoordinator::Transition(TransactionHandle& handle, TransactionState to) {
  if (!model::CanTransition(handle.state_, to)) {
    throw util::InvalidState("transaction " + handle.transaction_id_ + " cannot move from " + std::string(model::ToString(handle.state_)) +
                             " to " + std::string(model::ToString(to)));
  }
  handle.state_ = to;
}

ChangePayload TransactionCoordinator::BuildPayload(const TransactionHandle& handle) const {
  ChangePayload payload;
  payload.set_entity_id(handle.entity_id_);

  if (handle.vector_op_) {
    payload.set_has_vector(true);
    payload.set_content(handle.vector_op_->content);
    payload.set_content_hash(util::ContentHash(handle.vector_op_->content));
    for (const auto& [key, value] : handle.vector_op_->metadata) {
      (*payload.mutable_metadata())[key] = value;
    }
  }

  for (const auto& op : handle.graph_ops_) {
    if (const auto* node = std::get_if<store::GraphNodeUpsert>(&op)) {
      payload.set_has_node(true);
      payload.set_node_type(node->type);
      payload.set_element_type(node->type);
      if (node->content_hash) {
        payload.set_node_content_hash(*node->content_hash);
      }
      for (const auto& [key, value] : node->properties) {
        (*payload.mutable_node_properties())[key] = value;
      }
      continue;
    }

    const auto& rel = std::get<store::GraphRelationshipUpsert>(op).relationship;
    auto*       ref = payload.add_relationships();
    ref->set_source_id(rel.source_id);
    ref->set_target_id(rel.target_id);
    ref->set_type(rel.type);
  }

  if (payload.element_type().empty()) {
    if (auto it = payload.metadata().find("type"); it != payload.metadata().end()) {
      payload.set_element_type(it->second);
    }
  }
  if (payload.content_hash().empty()) {
    payload.set_content_hash(payload.node_content_hash());
  }
  return payload;
}

model::ChangeEvent TransactionCoordinator::Append(TransactionHandle& handle, model::ChangeStatus status, const std::string& phase,
                                                  const std::string& adapter, const std::string& detail, const ChangePayload& payload) {
  model::ChangeEvent event;
  event.transaction_id = handle.transaction_id_;
  event.entity_id      = handle.entity_id_;
  event.change_type    = handle.change_type_;
  event.status         = status;
  event.payload        = ledger::EncodePayload(payload);
  event.phase          = phase;
  event.adapter        = adapter;
  event.detail         = detail;
  return ledger_->Record(std::move(event));
}

void TransactionCoordinator::EnsurePendingRecorded(TransactionHandle& handle) {
  if (handle.pending_recorded_) {
    return;
  }
  Append(handle, model::ChangeStatus::kPending, "prepare", "", "", BuildPayload(handle));
  handle.pending_recorded_ = true;
}

TransactionCoordinator::DiscardOutcome TransactionCoordinator::DiscardStaged(TransactionHandle& handle) {
  DiscardOutcome outcome;

  auto note = [&](std::string_view adapter, const StoreStatus& status) {
    if (!outcome.detail.empty()) outcome.detail += "; ";
    outcome.detail += std::string(adapter) + ": " + status.ToString();
  };

  if (handle.graph_token_) {
    const auto status = graph_->Discard(*handle.graph_token_);
    if (!status) {
      outcome.leftovers.push_back({std::string(graph_->Name()), *handle.graph_token_});
      note(graph_->Name(), status);
    }
    handle.graph_token_.reset();
  }

  if (handle.vector_token_) {
    const auto status = vector_->Discard(*handle.vector_token_);
    if (!status) {
      outcome.leftovers.push_back({std::string(vector_->Name()), *handle.vector_token_});
      note(vector_->Name(), status);
    }
    handle.vector_token_.reset();
  }
  return outcome;
}

void TransactionCoordinator::CompleteRollback(TransactionHandle& handle, const std::string& phase, const std::string& adapter,
                                              const std::string& detail) {
  if (handle.state_ != TransactionState::kAborting) {
    Transition(handle, TransactionState::kAborting);
  }

  const auto discard = DiscardStaged(handle);
  if (!discard.Ok()) {
    PartialCommitAndThrow(handle, phase, "", discard.leftovers.front().adapter, detail + "; discard failed: " + discard.detail,
                          storykb::ledger::v1::RECONCILE_ACTION_DISCARD_STAGE, discard.leftovers);
  }

  Transition(handle, TransactionState::kRolledBack);
  observability::Metrics::Instance().RecordTransactionOutcome("rolled_back");
  STORYKB_LOG_WARN("transaction rolled back",
                   {StringField("entity_id", handle.entity_id_), StringField("transaction_id", handle.transaction_id_), StringField("phase", phase),
                    StringField("adapter", adapter.empty() ? "none" : adapter), StringField("detail", detail)});

  try {
    EnsurePendingRecorded(handle);
    Append(handle, model::ChangeStatus::kRolledBack, phase, adapter, detail, BuildPayload(handle));
  } catch (const std::exception& e) {
    Finish(handle);
    STORYKB_LOG_ERROR("rollback record not written", {StringField("entity_id", handle.entity_id_),
                                                       StringField("transaction_id", handle.transaction_id_), StringField("error", e.what())});
    throw;
  }
  Finish(handle);
}

void TransactionCoordinator::AbortAndThrow(TransactionHandle& handle, const std::string& phase, const std::string& adapter,
                                           const std::string& detail) {
  auto reported = detail;
  try {
    CompleteRollback(handle, phase, adapter, detail);
  } catch (const std::exception& e) {
    // both stages are gone once ROLLED_BACK; only the ledger record is missing
    if (handle.state_ != TransactionState::kRolledBack) throw;
    reported += "; ledger write failed: " + std::string(e.what());
  }
  throw util::AbortedError(handle.entity_id_, phase, adapter, "transaction " + handle.transaction_id_ + " rolled back: " + reported);
}

void TransactionCoordinator::PartialCommitAndThrow(TransactionHandle& handle, const std::string& phase, const std::string& committed_adapter,
                                                   const std::string& failed_adapter, const std::string& detail, ReconcileAction action,
                                                   const std::vector<LeftoverStage>& leftovers) {
  Transition(handle, TransactionState::kPartiallyCommitted);
  observability::Metrics::Instance().RecordTransactionOutcome("partially_committed");
  STORYKB_LOG_ERROR("transaction partially committed, reconciliation required",
                    {StringField("entity_id", handle.entity_id_), StringField("transaction_id", handle.transaction_id_),
                     StringField("phase", phase), StringField("failed_adapter", failed_adapter),
                     StringField("committed_adapter", committed_adapter.empty() ? "none" : committed_adapter), StringField("detail", detail)});

  auto payload = BuildPayload(handle);
  payload.set_committed_side(committed_adapter);
  payload.set_failed_side(failed_adapter);
  payload.set_action(action);
  payload.set_failure_detail(detail);
  for (const auto& leftover : leftovers) {
    auto* stage = payload.add_leftover_stages();
    stage->set_adapter(leftover.adapter);
    stage->set_staging_token(leftover.token);
  }

  std::uint64_t sequence = 0;
  auto          reported = detail;
  try {
    EnsurePendingRecorded(handle);
    sequence = Append(handle, model::ChangeStatus::kReconciliationRequired, phase, failed_adapter, detail, payload).sequence;
  } catch (const std::exception& e) {
    // the stores diverged either way; the payload in this log line is the only record of the repair
    STORYKB_LOG_ERROR("reconciliation record not written",
                      {StringField("entity_id", handle.entity_id_), StringField("transaction_id", handle.transaction_id_),
                       StringField("error", e.what()), StringField("payload", ledger::EncodePayload(payload))});
    reported += "; ledger write failed: " + std::string(e.what());
  }
  Finish(handle);

  util::ReconciliationRequired::Context context;
  context.entity_id         = handle.entity_id_;
  context.transaction_id    = handle.transaction_id_;
  context.phase             = phase;
  context.failed_adapter    = failed_adapter;
  context.committed_adapter = committed_adapter;
  context.ledger_sequence   = sequence;
  throw util::ReconciliationRequired(std::move(context), "stores diverged: " + reported);
}

void TransactionCoordinator::Finish(TransactionHandle& handle) {
  handle.lock_.Release();
}

void TransactionCoordinator::Abandon(TransactionHandle& handle) noexcept {
  try {
    CompleteRollback(handle, "rollback", "", "transaction handle released before completion");
  } catch (const std::exception& e) {
    STORYKB_LOG_ERROR("abandoned transaction did not roll back cleanly",
                      {StringField("entity_id", handle.entity_id_), StringField("transaction_id", handle.transaction_id_),
                       StringField("state", model::ToString(handle.state_)), StringField("error", e.what())});
  }
}

} // namespace storykb::coordinator

#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "internal/coordinator/retry_policy.hpp"
#include "internal/coordinator/transaction_handle.hpp"
#include "internal/ledger/change_ledger.hpp"
#include "internal/lock/entity_lock_table.hpp"
#include "internal/store/graph_store_adapter.hpp"
#include "internal/store/vector_store_adapter.hpp"
#include "storykb/ledger/v1/change_payload.pb.h"

namespace storykb::coordinator {

struct CoordinatorOptions {
  lock::ConflictPolicy      conflict_policy   = lock::ConflictPolicy::kWait;
  std::chrono::milliseconds lock_wait_timeout = std::chrono::milliseconds(10000);
  RetryPolicy               retry;
};

/*
  Drives one logical update through both stores.

    Begin -> Stage* -> Prepare -> Commit
                   \-> Rollback (STAGING or PREPARED)

  Prepare stages graph then vector; any failure discards everything and
  throws AbortedError. Commit applies graph then vector. If graph fails
  nothing is visible and AbortedError is thrown; if graph committed and
  vector did not, the transaction ends PARTIALLY_COMMITTED, the ledger gets
  a reconciliation_required record and ReconciliationRequired is thrown.

  The ledger gets a pending record when Prepare starts and one record for
  the final status.
*/
class TransactionCoordinator {
 public:
  TransactionCoordinator(std::shared_ptr<store::GraphStoreAdapter> graph, std::shared_ptr<store::VectorStoreAdapter> vector,
                         std::shared_ptr<ledger::ChangeLedger> ledger, CoordinatorOptions options = {});

  std::unique_ptr<TransactionHandle> Begin(const model::EntityIdentifier& entity_id, model::ChangeType change_type);

  void StageVectorOp(TransactionHandle& handle, store::VectorUpsert op);
  void StageGraphOp(TransactionHandle& handle, store::GraphOp op);

  void Prepare(TransactionHandle& handle, util::Deadline deadline);
  void Commit(TransactionHandle& handle, util::Deadline deadline);
  void Rollback(TransactionHandle& handle);

  // Shared with the reconciliation sweeper so repairs never race a live
  // transaction on the same entity.
  lock::EntityLockTable& Locks() {
    return locks_;
  }

  const CoordinatorOptions& Options() const {
    return options_;
  }

 private:
  friend class TransactionHandle;

  struct LeftoverStage {
    std::string adapter;
    std::string token;
  };

  // Every stage whose discard failed, graph first.
  struct DiscardOutcome {
    std::vector<LeftoverStage> leftovers;
    std::string                detail;

    bool Ok() const {
      return leftovers.empty();
    }
  };

  void RequireState(const TransactionHandle& handle, model::TransactionState expected, const char* operation) const;
  void Transition(TransactionHandle& handle, model::TransactionState to);

  storykb::ledger::v1::ChangePayload BuildPayload(const TransactionHandle& handle) const;

  model::ChangeEvent Append(TransactionHandle& handle, model::ChangeStatus status, const std::string& phase, const std::string& adapter,
                            const std::string& detail, const storykb::ledger::v1::ChangePayload& payload);
  void               EnsurePendingRecorded(TransactionHandle& handle);

  DiscardOutcome DiscardStaged(TransactionHandle& handle);

  // Terminal paths. Each leaves the handle terminal with its lock released.
  // CompleteRollback throws ReconciliationRequired when a stage cannot be
  // discarded. PartialCommitAndThrow throws ReconciliationRequired even when
  // its ledger record cannot be written; the sequence is then 0.
  void              CompleteRollback(TransactionHandle& handle, const std::string& phase, const std::string& adapter, const std::string& detail);
  [[noreturn]] void AbortAndThrow(TransactionHandle& handle, const std::string& phase, const std::string& adapter, const std::string& detail);
  [[noreturn]] void PartialCommitAndThrow(TransactionHandle& handle, const std::string& phase, const std::string& committed_adapter,
                                          const std::string& failed_adapter, const std::string& detail, storykb::ledger::v1::ReconcileAction action,
                                          const std::vector<LeftoverStage>& leftovers);
  void              Finish(TransactionHandle& handle);

  // Called from ~TransactionHandle; never throws.
  void Abandon(TransactionHandle& handle) noexcept;

  std::shared_ptr<store::GraphStoreAdapter>  graph_;
  std::shared_ptr<store::VectorStoreAdapter> vector_;
  std::shared_ptr<ledger::ChangeLedger>      ledger_;
  CoordinatorOptions                         options_;
  lock::EntityLockTable                      locks_;
};

} // namespace storykb::coordinator

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "internal/coordinator/transaction_coordinator.hpp"
#include "internal/ledger/change_ledger.hpp"
#include "internal/store/graph_store_adapter.hpp"
#include "internal/store/vector_store_adapter.hpp"

namespace storykb::reconcile {

struct SweeperOptions {
  std::chrono::milliseconds interval          = std::chrono::milliseconds(30000);
  std::size_t               batch_size        = 64;
  std::chrono::milliseconds operation_timeout = std::chrono::milliseconds(5000);
};

struct SweepStats {
  std::size_t examined     = 0;
  std::size_t converged    = 0;
  std::size_t superseded   = 0;
  std::size_t failed       = 0; // left open for the next pass
  std::size_t unrepairable = 0; // closed as failed
  std::size_t skipped      = 0;
};

/*
  Completes transactions left PARTIALLY_COMMITTED.

  Each pass reads the oldest reconciliation_required records and applies
  the action stored in their payload:

    COMPLETE_VECTOR_UPSERT  re-apply the vector upsert     -> committed
    DISCARD_STAGE           discard every leftover stage   -> rolled_back

  Leftover stages listed in the payload are discarded before either action.
  A vector repair whose graph node has since moved to another content hash
  is closed as committed without re-applying the stale content. Entities
  locked by a live transaction are skipped until the next pass.

  A repair that fails on a transient store error appends nothing and is
  retried next time. A record that can never be repaired (unreadable
  payload, unknown adapter, no action) is closed as failed so it stops
  occupying the batch.
*/
class ReconciliationSweeper {
 public:
  ReconciliationSweeper(std::shared_ptr<ledger::ChangeLedger> ledger, std::shared_ptr<store::GraphStoreAdapter> graph,
                        std::shared_ptr<store::VectorStoreAdapter> vector, std::shared_ptr<coordinator::TransactionCoordinator> coordinator,
                        SweeperOptions options = {});
  ~ReconciliationSweeper();

  void Start();
  void Stop();

  bool Running() const {
    return running_;
  }

  SweepStats SweepOnce();

 private:
  enum class Outcome {
    kConverged,
    kSuperseded,
    kFailed,
    kUnrepairable,
    kSkipped,
  };

  Outcome            Reconcile(const model::ChangeEvent& event);
  Outcome            CloseUnrepairable(const model::ChangeEvent& event, const std::string& reason);
  store::StoreStatus DiscardLeftovers(const storykb::ledger::v1::ChangePayload& payload);
  void               Loop();

  std::shared_ptr<ledger::ChangeLedger>                 ledger_;
  std::shared_ptr<store::GraphStoreAdapter>             graph_;
  std::shared_ptr<store::VectorStoreAdapter>            vector_;
  std::shared_ptr<coordinator::TransactionCoordinator> coordinator_;
  SweeperOptions                                        options_;

  std::thread             thread_;
  std::atomic<bool>       running_{false};
  std::mutex              wake_mutex_;
  std::condition_variable wake_;
};

} // namespace storykb::reconcile

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace storykb::util {

/*
  Central error types.

  Callers must be able to tell "nothing happened" (ValidationError,
  AbortedError, ConcurrencyConflict) from "reconciliation required".
  Context is carried both as fields and as key=value pairs in what().
*/

class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class TransientStoreError : public std::runtime_error {
 public:
  explicit TransientStoreError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ConcurrencyConflict : public std::runtime_error {
 public:
  ConcurrencyConflict(std::string entity_id, const std::string& msg)
      : std::runtime_error(msg + " entity_id=" + entity_id), entity_id_(std::move(entity_id)) {
  }

  const std::string& EntityId() const {
    return entity_id_;
  }

 private:
  std::string entity_id_;
};

/*
  A transaction ended ROLLED_BACK. Both stores are unchanged; retrying the
  whole operation from scratch is safe.
*/
class AbortedError : public std::runtime_error {
 public:
  AbortedError(std::string entity_id, std::string phase, std::string adapter, const std::string& msg)
      : std::runtime_error(msg + " entity_id=" + entity_id + " phase=" + phase + " adapter=" + adapter),
        entity_id_(std::move(entity_id)),
        phase_(std::move(phase)),
        adapter_(std::move(adapter)) {
  }

  const std::string& EntityId() const {
    return entity_id_;
  }
  const std::string& Phase() const {
    return phase_;
  }
  const std::string& Adapter() const {
    return adapter_;
  }

 private:
  std::string entity_id_;
  std::string phase_;
  std::string adapter_;
};

/*
  One side committed and the other did not, or a stage could not be
  discarded. The ledger holds a reconciliation_required record at
  `LedgerSequence()`, or the sequence is 0 when that record could not be
  written. Callers must not blindly replay the full write.
*/
class ReconciliationRequired : public std::runtime_error {
 public:
  struct Context {
    std::string   entity_id;
    std::string   transaction_id;
    std::string   phase;
    std::string   failed_adapter;
    std::string   committed_adapter;
    std::uint64_t ledger_sequence = 0;
  };

  ReconciliationRequired(Context context, const std::string& msg)
      : std::runtime_error(msg + " entity_id=" + context.entity_id + " transaction_id=" + context.transaction_id + " phase=" + context.phase +
                           " failed_adapter=" + context.failed_adapter +
                           " committed_adapter=" + (context.committed_adapter.empty() ? "none" : context.committed_adapter)),
        context_(std::move(context)) {
  }

  const std::string& EntityId() const {
    return context_.entity_id;
  }
  const std::string& TransactionId() const {
    return context_.transaction_id;
  }
  const std::string& Phase() const {
    return context_.phase;
  }
  const std::string& FailedAdapter() const {
    return context_.failed_adapter;
  }
  const std::string& CommittedAdapter() const {
    return context_.committed_adapter;
  }
  std::uint64_t LedgerSequence() const {
    return context_.ledger_sequence;
  }

 private:
  Context context_;
};

} // namespace storykb::util

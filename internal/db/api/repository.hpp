#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/change_event_record.hpp"
#include "internal/db/model/identity_record.hpp"

namespace storykb::db {

/*
  Repository abstraction for the registry and the ledger.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - natural_key and entity_id are each unique in the identity table
  - Change event sequences are strictly increasing in append order
  - Nothing is ever updated or deleted: both tables are append-only
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Entity identity (natural key -> canonical id)
  // ---------------------------------------------------------------------

  // AlreadyExists when either the key or the id is taken.
  virtual Result InsertIdentity(Transaction&, const model::IdentityRecord&) = 0;

  virtual std::optional<model::IdentityRecord> GetIdentityByKey(Transaction&, const std::string& natural_key) = 0;

  virtual std::optional<model::IdentityRecord> GetIdentityById(Transaction&, const std::string& entity_id) = 0;

  // ---------------------------------------------------------------------
  // Change ledger
  // ---------------------------------------------------------------------

  // Assigns record.sequence.
  virtual Result AppendChangeEvent(Transaction&, model::ChangeEventRecord& record) = 0;

  virtual std::optional<model::ChangeEventRecord> GetLatestChangeEvent(Transaction&, const std::string& transaction_id) = 0;

  virtual std::vector<model::ChangeEventRecord> ListChangeEventsByEntity(Transaction&, const std::string& entity_id) = 0;

  virtual std::vector<model::ChangeEventRecord> ListChangeEventsByTransaction(Transaction&, const std::string& transaction_id) = 0;

  // Latest record of each transaction whose latest status is `status`,
  // ordered by that record's sequence.
  virtual std::vector<model::ChangeEventRecord> ListLatestByStatus(Transaction&, model::ChangeStatus status, std::size_t limit) = 0;
};

} // namespace storykb::db

#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace storykb::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertIdentity(Transaction&, const model::IdentityRecord&) override;
  std::optional<model::IdentityRecord> GetIdentityByKey(Transaction&, const std::string& natural_key) override;
  std::optional<model::IdentityRecord> GetIdentityById(Transaction&, const std::string& entity_id) override;

  Result AppendChangeEvent(Transaction&, model::ChangeEventRecord& record) override;
  std::optional<model::ChangeEventRecord> GetLatestChangeEvent(Transaction&, const std::string& transaction_id) override;
  std::vector<model::ChangeEventRecord> ListChangeEventsByEntity(Transaction&, const std::string& entity_id) override;
  std::vector<model::ChangeEventRecord> ListChangeEventsByTransaction(Transaction&, const std::string& transaction_id) override;
  std::vector<model::ChangeEventRecord> ListLatestByStatus(Transaction&, model::ChangeStatus status, std::size_t limit) override;

private:
  std::shared_ptr<SqliteDB> db_;
  std::mutex tx_mutex_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}

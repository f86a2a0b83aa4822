#include "sqlite_schema.hpp"

#include <string>
#include <vector>

namespace storykb::db::sqlite {

void BootstrapLedgerSchema(SqliteDB& db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS entity_identity (natural_key TEXT PRIMARY KEY, entity_id TEXT NOT NULL UNIQUE, created_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS change_event (sequence INTEGER PRIMARY KEY AUTOINCREMENT, transaction_id TEXT NOT NULL, entity_id TEXT NOT NULL, "
      "timestamp_ms INTEGER NOT NULL, change_type INTEGER NOT NULL, status INTEGER NOT NULL, payload TEXT NOT NULL, phase TEXT, adapter TEXT, detail TEXT);",
      "CREATE INDEX IF NOT EXISTS change_event_by_entity ON change_event(entity_id, sequence);",
      "CREATE INDEX IF NOT EXISTS change_event_by_transaction ON change_event(transaction_id, sequence);"};

  for (const auto& sql : kBootstrapSql) {
    db.Exec(sql);
  }

  db.Exec("SELECT natural_key,entity_id,created_at_ms FROM entity_identity LIMIT 1;");
  db.Exec("SELECT sequence,transaction_id,entity_id,timestamp_ms,change_type,status,payload,phase,adapter,detail FROM change_event LIMIT 1;");
}

} // namespace storykb::db::sqlite

#pragma once

#include "sqlite_db.hpp"

namespace storykb::db::sqlite {

/*
  Creates the registry and ledger tables when missing and probes the
  expected columns so a stale file fails at startup rather than mid-write.
*/
void BootstrapLedgerSchema(SqliteDB& db);

} // namespace storykb::db::sqlite

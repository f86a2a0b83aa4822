#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/util/time.hpp"

namespace storykb::store::sqlite {

/*
  Bounded pool of sqlite connections to one database file.

  - A staged graph write owns one connection from PrepareWrite until
    Commit/Discard, so max_connections bounds in-flight transactions.
  - Connections come back to the pool when the last shared_ptr drops.
    A connection still inside a transaction is closed instead, which makes
    sqlite roll that transaction back, and its slot is freed.

  Lifetime:
    SqliteGraphStore owns shared_ptr<SqliteConnectionPool>
    Staged writes hold shared_ptr<SqliteDB>
*/
class SqliteConnectionPool : public std::enable_shared_from_this<SqliteConnectionPool> {
 public:
  SqliteConnectionPool(std::string path, std::size_t max_connections, int busy_timeout_ms);

  // nullptr when no connection frees up before the deadline.
  std::shared_ptr<db::sqlite::SqliteDB> Acquire(util::Deadline deadline);

  std::size_t LiveConnections() const;

 private:
  std::shared_ptr<db::sqlite::SqliteDB> Wrap(db::sqlite::SqliteDB* conn);
  void                                  Release(db::sqlite::SqliteDB* conn);

  std::string path_;
  std::size_t max_connections_;
  int         busy_timeout_ms_;

  mutable std::mutex                                 mutex_;
  std::condition_variable                            cv_;
  std::vector<std::unique_ptr<db::sqlite::SqliteDB>> idle_;
  std::size_t                                        live_connections_ = 0;
};

} // namespace storykb::store::sqlite

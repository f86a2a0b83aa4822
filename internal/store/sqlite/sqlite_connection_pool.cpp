#include "sqlite_connection_pool.hpp"

#include "internal/observability/logging.hpp"

namespace storykb::store::sqlite {

using db::sqlite::SqliteDB;

SqliteConnectionPool::SqliteConnectionPool(std::string path, std::size_t max_connections, int busy_timeout_ms)
    : path_(std::move(path)), max_connections_(max_connections == 0 ? 1 : max_connections), busy_timeout_ms_(busy_timeout_ms) {
}

std::shared_ptr<SqliteDB> SqliteConnectionPool::Acquire(util::Deadline deadline) {
  std::unique_lock lock(mutex_);

  for (;;) {
    if (!idle_.empty()) {
      auto conn = std::move(idle_.back());
      idle_.pop_back();
      return Wrap(conn.release());
    }

    if (live_connections_ < max_connections_) {
      ++live_connections_;
      lock.unlock();

      try {
        return Wrap(new SqliteDB(path_, busy_timeout_ms_));
      } catch (const db::sqlite::SqliteError&) {
        std::lock_guard rollback_lock(mutex_);
        --live_connections_;
        cv_.notify_one();
        throw;
      }
    }

    const bool ready = cv_.wait_until(lock, deadline, [this] {
      return !idle_.empty() || live_connections_ < max_connections_;
    });
    if (!ready) {
      return nullptr;
    }
  }
}

std::size_t SqliteConnectionPool::LiveConnections() const {
  std::lock_guard lock(mutex_);
  return live_connections_;
}

std::shared_ptr<SqliteDB> SqliteConnectionPool::Wrap(SqliteDB* conn) {
  std::weak_ptr<SqliteConnectionPool> weak_self = shared_from_this();
  return std::shared_ptr<SqliteDB>(conn, [weak_self](SqliteDB* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void SqliteConnectionPool::Release(SqliteDB* conn) {
  if (conn->InTransaction()) {
    STORYKB_LOG_WARN("sqlite connection released inside a transaction, closing it", {observability::StringField("path", path_)});
    delete conn;

    std::lock_guard lock(mutex_);
    --live_connections_;
    cv_.notify_one();
    return;
  }

  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace storykb::store::sqlite

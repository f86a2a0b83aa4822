#include "sqlite_graph_store.hpp"

#include <sqlite3.h>

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/store/merge.hpp"
#include "internal/util/uuid.hpp"

namespace storykb::store::sqlite {

using db::sqlite::SqliteDB;
using db::sqlite::SqliteError;
using db::sqlite::Statement;

namespace {

const char* kSchema[] = {
    "CREATE TABLE IF NOT EXISTS graph_node (id TEXT PRIMARY KEY, type TEXT NOT NULL, content_hash TEXT NOT NULL DEFAULT '', "
    "version INTEGER NOT NULL);",
    "CREATE TABLE IF NOT EXISTS graph_node_property (node_id TEXT NOT NULL, key TEXT NOT NULL, value TEXT NOT NULL, "
    "PRIMARY KEY(node_id, key));",
    "CREATE TABLE IF NOT EXISTS graph_edge (source_id TEXT NOT NULL, target_id TEXT NOT NULL, type TEXT NOT NULL, "
    "PRIMARY KEY(source_id, target_id, type));",
};

StoreStatus FromSqlite(int rc, const std::string& what) {
  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return StoreStatus::Err(StoreErrorCode::kUnavailable, what);
    default:
      return StoreStatus::Err(StoreErrorCode::kInternal, what);
  }
}

StoreStatus FromSqlite(sqlite3* db, const std::string& what) {
  return FromSqlite(sqlite3_extended_errcode(db), what + ": " + sqlite3_errmsg(db));
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

// nullopt with *status set on a read error; nullopt with OK when absent.
std::optional<model::GraphNode> ReadNode(sqlite3* db, const std::string& id, StoreStatus* status) {
  *status = StoreStatus::Ok();

  Statement node_st(db, "SELECT id,type,content_hash,version FROM graph_node WHERE id=?;");
  if (!node_st) {
    *status = FromSqlite(db, "prepare node read");
    return std::nullopt;
  }
  BindText(node_st.get(), 1, id);

  const int rc = sqlite3_step(node_st.get());
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) {
    *status = FromSqlite(db, "read node");
    return std::nullopt;
  }

  model::GraphNode node;
  node.id           = ColText(node_st.get(), 0);
  node.type         = ColText(node_st.get(), 1);
  node.content_hash = ColText(node_st.get(), 2);
  node.version      = static_cast<std::uint64_t>(sqlite3_column_int64(node_st.get(), 3));

  Statement prop_st(db, "SELECT key,value FROM graph_node_property WHERE node_id=?;");
  if (!prop_st) {
    *status = FromSqlite(db, "prepare property read");
    return std::nullopt;
  }
  BindText(prop_st.get(), 1, id);
  while (sqlite3_step(prop_st.get()) == SQLITE_ROW) {
    node.properties[ColText(prop_st.get(), 0)] = ColText(prop_st.get(), 1);
  }
  return node;
}

StoreStatus WriteNode(sqlite3* db, const model::GraphNode& node, const model::Properties& changed_properties) {
  Statement node_st(db,
                    "INSERT INTO graph_node(id,type,content_hash,version) VALUES(?,?,?,?) "
                    "ON CONFLICT(id) DO UPDATE SET type=excluded.type, content_hash=excluded.content_hash, version=excluded.version;");
  if (!node_st) return FromSqlite(db, "prepare node write");

  BindText(node_st.get(), 1, node.id);
  BindText(node_st.get(), 2, node.type);
  BindText(node_st.get(), 3, node.content_hash);
  sqlite3_bind_int64(node_st.get(), 4, static_cast<sqlite3_int64>(node.version));
  if (sqlite3_step(node_st.get()) != SQLITE_DONE) return FromSqlite(db, "write node");

  for (const auto& [key, value] : changed_properties) {
    Statement prop_st(db,
                      "INSERT INTO graph_node_property(node_id,key,value) VALUES(?,?,?) "
                      "ON CONFLICT(node_id,key) DO UPDATE SET value=excluded.value;");
    if (!prop_st) return FromSqlite(db, "prepare property write");

    BindText(prop_st.get(), 1, node.id);
    BindText(prop_st.get(), 2, key);
    BindText(prop_st.get(), 3, value);
    if (sqlite3_step(prop_st.get()) != SQLITE_DONE) return FromSqlite(db, "write property");
  }
  return StoreStatus::Ok();
}

StoreStatus WriteEdge(sqlite3* db, const model::Relationship& rel) {
  Statement st(db, "INSERT OR IGNORE INTO graph_edge(source_id,target_id,type) VALUES(?,?,?);");
  if (!st) return FromSqlite(db, "prepare edge write");

  BindText(st.get(), 1, rel.source_id);
  BindText(st.get(), 2, rel.target_id);
  BindText(st.get(), 3, rel.type);
  if (sqlite3_step(st.get()) != SQLITE_DONE) return FromSqlite(db, "write edge");
  return StoreStatus::Ok();
}

StoreStatus ApplyOps(sqlite3* db, const std::vector<GraphOp>& ops) {
  for (const auto& op : ops) {
    if (const auto* upsert = std::get_if<GraphNodeUpsert>(&op)) {
      StoreStatus status;
      auto        node = ReadNode(db, upsert->id, &status).value_or(model::GraphNode{});
      if (!status) return status;

      if (MergeNode(node, *upsert)) {
        if (auto written = WriteNode(db, node, upsert->properties); !written) return written;
      }
      continue;
    }

    if (auto written = WriteEdge(db, std::get<GraphRelationshipUpsert>(op).relationship); !written) return written;
  }
  return StoreStatus::Ok();
}

void RollbackQuietly(SqliteDB& conn, const char* context) {
  try {
    conn.Exec("ROLLBACK;");
  } catch (const SqliteError& e) {
    STORYKB_LOG_WARN("sqlite graph rollback failed", {observability::StringField("context", context),
                                                      observability::StringField("error", e.what())});
  }
}

} // namespace

SqliteGraphStore::SqliteGraphStore(std::string path, std::size_t max_connections, int busy_timeout_ms)
    : busy_timeout_ms_(busy_timeout_ms),
      pool_(std::make_shared<SqliteConnectionPool>(path, max_connections, busy_timeout_ms)),
      reader_(std::make_unique<SqliteDB>(path, busy_timeout_ms)) {
  for (const char* sql : kSchema) {
    reader_->Exec(sql);
  }
}

SqliteGraphStore::~SqliteGraphStore() {
  std::lock_guard lock(staged_mutex_);
  for (auto& [token, conn] : staged_) {
    RollbackQuietly(*conn, "shutdown");
  }
  staged_.clear();
}

StoreStatus SqliteGraphStore::PrepareWrite(const std::vector<GraphOp>& ops, util::Deadline deadline, StagingToken* token) {
  if (token == nullptr) {
    return StoreStatus::Err(StoreErrorCode::kInvalidArgument, "token out-parameter is null");
  }
  for (const auto& op : ops) {
    if (auto error = ValidateGraphOp(op); !error.empty()) {
      return StoreStatus::Err(StoreErrorCode::kInvalidArgument, error);
    }
  }
  if (util::Expired(deadline)) {
    return StoreStatus::Err(StoreErrorCode::kDeadlineExceeded, "graph prepare");
  }

  std::shared_ptr<SqliteDB> conn;
  try {
    conn = pool_->Acquire(deadline);
  } catch (const SqliteError& e) {
    return FromSqlite(e.Code(), std::string("open connection: ") + e.what());
  }
  if (!conn) {
    return StoreStatus::Err(StoreErrorCode::kDeadlineExceeded, "no sqlite connection available before deadline");
  }

  try {
    const auto remaining = static_cast<int>(util::Remaining(deadline).count());
    conn->SetBusyTimeout(std::max(1, std::min(busy_timeout_ms_, remaining)));
    conn->Exec("BEGIN IMMEDIATE;");
  } catch (const SqliteError& e) {
    return FromSqlite(e.Code(), std::string("begin: ") + e.what());
  }

  if (auto applied = ApplyOps(conn->Handle(), ops); !applied) {
    RollbackQuietly(*conn, "prepare");
    return applied;
  }

  std::lock_guard lock(staged_mutex_);
  *token          = util::NewId();
  staged_[*token] = std::move(conn);
  return StoreStatus::Ok();
}

std::shared_ptr<SqliteDB> SqliteGraphStore::TakeStaged(const StagingToken& token) {
  std::lock_guard lock(staged_mutex_);
  auto            it = staged_.find(token);
  if (it == staged_.end()) return nullptr;
  auto conn = std::move(it->second);
  staged_.erase(it);
  return conn;
}

StoreStatus SqliteGraphStore::Commit(const StagingToken& token, util::Deadline deadline) {
  {
    std::lock_guard lock(staged_mutex_);
    if (!staged_.contains(token)) {
      return StoreStatus::Err(StoreErrorCode::kNotFound, "unknown staging token " + token);
    }
    // the stage stays open so the caller can still discard it
    if (util::Expired(deadline)) {
      return StoreStatus::Err(StoreErrorCode::kDeadlineExceeded, "graph commit");
    }
  }

  auto conn = TakeStaged(token);
  if (!conn) {
    return StoreStatus::Err(StoreErrorCode::kNotFound, "unknown staging token " + token);
  }

  try {
    conn->Exec("COMMIT;");
  } catch (const SqliteError& e) {
    RollbackQuietly(*conn, "commit");
    // still open: keep it staged so a Discard can finish the rollback
    if (conn->InTransaction()) Restage(token, std::move(conn));
    return FromSqlite(e.Code(), std::string("commit: ") + e.what());
  }
  return StoreStatus::Ok();
}

StoreStatus SqliteGraphStore::Discard(const StagingToken& token) {
  auto conn = TakeStaged(token);
  if (!conn) {
    return StoreStatus::Ok();
  }

  try {
    conn->Exec("ROLLBACK;");
  } catch (const SqliteError& e) {
    if (!conn->InTransaction()) {
      return StoreStatus::Ok();
    }
    Restage(token, std::move(conn));
    return FromSqlite(e.Code(), std::string("discard: ") + e.what());
  }
  return StoreStatus::Ok();
}

void SqliteGraphStore::Restage(const StagingToken& token, std::shared_ptr<SqliteDB> conn) {
  std::lock_guard lock(staged_mutex_);
  staged_[token] = std::move(conn);
}

std::optional<model::GraphNode> SqliteGraphStore::FindNode(const model::EntityIdentifier& id) {
  std::lock_guard lock(reader_mutex_);

  StoreStatus status;
  auto        node = ReadNode(reader_->Handle(), id, &status);
  if (!status) {
    STORYKB_LOG_WARN("sqlite graph node read failed", {observability::StringField("entity_id", id),
                                                       observability::StringField("error", status.ToString())});
  }
  return node;
}

std::vector<model::Relationship> SqliteGraphStore::FindRelationships(const model::EntityIdentifier& source_id) {
  std::lock_guard lock(reader_mutex_);

  std::vector<model::Relationship> out;
  Statement st(reader_->Handle(), "SELECT source_id,target_id,type FROM graph_edge WHERE source_id=? ORDER BY target_id,type;");
  if (!st) return out;

  BindText(st.get(), 1, source_id);
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back({ColText(st.get(), 0), ColText(st.get(), 1), ColText(st.get(), 2)});
  }
  return out;
}

std::size_t SqliteGraphStore::StagedCount() const {
  std::lock_guard lock(staged_mutex_);
  return staged_.size();
}

} // namespace storykb::store::sqlite

#pragma once

#include <sqlite3.h>

#include <memory>
#include <stdexcept>
#include <string>

namespace storykb::db::sqlite {

class SqliteError : public std::runtime_error {
 public:
  SqliteError(int code, const std::string& msg) : std::runtime_error(msg), code_(code) {
  }

  int Code() const {
    return code_;
  }

  bool IsBusy() const {
    return (code_ & 0xFF) == SQLITE_BUSY || (code_ & 0xFF) == SQLITE_LOCKED;
  }

 private:
  int code_;
};

/*
  Thin RAII wrapper around sqlite3*.

  One instance is one connection. Connections are not shared between
  concurrent transactions.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, int busy_timeout_ms = 5000);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

  void SetBusyTimeout(int busy_timeout_ms);

  // true while a BEGIN has not been matched by COMMIT or ROLLBACK
  bool InTransaction() const {
    return sqlite3_get_autocommit(db_) == 0;
  }

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  int         busy_timeout_ms_;
};

/*
  Owns a prepared statement for the duration of a scope.
*/
class Statement {
 public:
  Statement(sqlite3* db, const char* sql);
  ~Statement();

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const {
    return stmt_;
  }
  int PrepareCode() const {
    return prepare_rc_;
  }
  explicit operator bool() const {
    return stmt_ != nullptr;
  }

 private:
  sqlite3_stmt* stmt_       = nullptr;
  int           prepare_rc_ = SQLITE_OK;
};

} // namespace storykb::db::sqlite

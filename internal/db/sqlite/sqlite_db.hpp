#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <mutex>
#include <string>

#include "internal/db/api/result.hpp"

namespace callscribe::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  The connection is opened in serialized mode; Lock() additionally guards
  multi-statement sequences (insert + last_insert_rowid) issued by one caller.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  std::unique_lock<std::mutex> Lock() {
    return std::unique_lock<std::mutex>(mutex_);
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize, or wrap it in Statement)
  sqlite3_stmt* Prepare(const std::string& sql);

  // WAL, busy timeout, in-memory temp store
  void Configure();

  Result Translate(int rc) const;

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  mutex_;
};

/*
  Owns one prepared statement for the scope of a query.
*/
class Statement {
 public:
  Statement(SqliteDB& db, const std::string& sql);
  ~Statement();

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  void BindText(int idx, const std::string& value);
  void BindInt64(int idx, int64_t value);

  // Returns SQLITE_ROW, SQLITE_DONE or an error code.
  int Step();

  std::string ColumnText(int col) const;
  int64_t     ColumnInt64(int col) const;

 private:
  sqlite3_stmt* stmt_ = nullptr;
};

} // namespace callscribe::db::sqlite

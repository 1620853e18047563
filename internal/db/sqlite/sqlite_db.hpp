#pragma once

#include <sqlite3.h>

#include <chrono>
#include <string>

namespace gearledger::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  A SqliteDB is used by one worker at a time (see SqlitePool); it is opened
  without SQLite's own serialization mutex.
*/
class SqliteDB {
 public:
  SqliteDB(std::string path, std::chrono::milliseconds busy_timeout);
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

  // Configure recommended PRAGMAs (WAL, busy timeout, etc.)
  void Configure();

 private:
  sqlite3*                  db_ = nullptr;
  std::string               path_;
  std::chrono::milliseconds busy_timeout_;
};

} // namespace gearledger::db::sqlite

#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace gearledger::db::sqlite {

/*
  SQLite transaction wrapper.

  Owns its pooled connection for its whole lifetime.

  Write transactions use BEGIN IMMEDIATE:
    - grabs write lock early
    - avoids deadlock-y behavior later
  Read transactions use BEGIN DEFERRED so WAL readers never wait on a writer.
*/
class SqliteTransaction final : public db::Transaction {
public:
  SqliteTransaction(std::shared_ptr<SqliteDB> db, TxMode mode);
  ~SqliteTransaction();

  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  std::shared_ptr<SqliteDB> db_;
  bool committed_ = false;
};

}

#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace gearledger::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db, TxMode mode) : db_(std::move(db)) {
  db_->Exec(mode == TxMode::kWrite ? "BEGIN IMMEDIATE;" : "BEGIN DEFERRED;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!committed_) {
    try {
      db_->Exec("ROLLBACK;");
    } catch (const std::exception& e) {
      GEARLEDGER_LOG_WARN("sqlite rollback failed", {observability::StringField("error", e.what())});
    }
  }
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  committed_ = true;
}

void SqliteTransaction::Rollback() {
  db_->Exec("ROLLBACK;");
  committed_ = true;
}

} // namespace gearledger::db::sqlite

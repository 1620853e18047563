#pragma once

#include <memory>

#include "internal/db/api/results_repository.hpp"
#include "sqlite_pool.hpp"
#include "sqlite_tx.hpp"

namespace gearledger::db::sqlite {

class SqliteRepository final : public db::ResultsRepository {
public:
  explicit SqliteRepository(std::shared_ptr<SqlitePool> pool);

  std::unique_ptr<Transaction> Begin(TxMode mode) override;

  std::optional<model::ResultRecord> FindByKey(Transaction&, const std::string& normalized_key,
                                               const std::string& client_key) override;
  Result InsertResult(Transaction&, model::ResultRecord& record) override;
  Result UpdateResult(Transaction&, const model::ResultRecord& record) override;
  std::optional<model::ResultRecord> GetResult(Transaction&, int64_t id) override;
  std::vector<model::ResultRecord> ListResults(Transaction&, const std::optional<std::string>& client_key) override;
  Result PatchResult(Transaction&, int64_t id, const model::ResultPatch& patch, const std::string& now) override;
  Result DeleteResult(Transaction&, int64_t id) override;
  Result ClearResults(Transaction&, const std::optional<std::string>& client_key, int64_t* deleted) override;
  std::vector<std::string> ListClients(Transaction&) override;

private:
  std::shared_ptr<SqlitePool> pool_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}

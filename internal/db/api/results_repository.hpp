#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/result_record.hpp"

namespace gearledger::db {

/*
  Repository abstraction for the results ledger.

  CRITICAL GUARANTEES:

  - All access goes through a Transaction
  - Reads inside a transaction see its writes
  - At most one row per (normalized_key, client_key); inserting a duplicate
    returns ConstraintViolation
*/

class ResultsRepository {
 public:
  virtual ~ResultsRepository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin(TxMode mode = TxMode::kWrite) = 0;

  // ---------------------------------------------------------------------
  // Rows
  // ---------------------------------------------------------------------

  virtual std::optional<model::ResultRecord> FindByKey(Transaction&, const std::string& normalized_key,
                                                       const std::string& client_key) = 0;

  // Assigns record.id on success.
  virtual Result InsertResult(Transaction&, model::ResultRecord& record) = 0;

  // Writes every mutable column of an existing row.
  virtual Result UpdateResult(Transaction&, const model::ResultRecord& record) = 0;

  virtual std::optional<model::ResultRecord> GetResult(Transaction&, int64_t id) = 0;

  // Newest first. client_key filters on upper(client) when set.
  virtual std::vector<model::ResultRecord> ListResults(Transaction&, const std::optional<std::string>& client_key) = 0;

  // NotFound when no row has this id.
  virtual Result PatchResult(Transaction&, int64_t id, const model::ResultPatch& patch, const std::string& now) = 0;

  virtual Result DeleteResult(Transaction&, int64_t id) = 0;

  virtual Result ClearResults(Transaction&, const std::optional<std::string>& client_key, int64_t* deleted) = 0;

  // Distinct stored client names, sorted.
  virtual std::vector<std::string> ListClients(Transaction&) = 0;
};

} // namespace gearledger::db

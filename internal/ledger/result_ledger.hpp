#pragma once

#include <cstdint>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/results_repository.hpp"
#include "internal/db/model/result_record.hpp"

namespace gearledger::ledger {

// Quantities travel as int32 on the wire.
inline constexpr int64_t kMaxQuantity = std::numeric_limits<int32_t>::max();

struct ResultWrite {
  std::string artikul;
  std::string client;
  int64_t     quantity = 1;
  double      weight   = 0.0;
  std::string brand;
  std::string description;
  double      sale_price = 0.0;
};

struct UpsertOutcome {
  bool    inserted = false;
  int64_t id       = 0;
};

/*
  ResultLedger

  Storage-layer operations on the results ledger. Every call runs in its own
  transaction on a connection checked out for the calling thread only.

  Merge rules for UpsertResult on an existing (normalized artikul, client):
    quantity    += write.quantity
    sale_price   = write.sale_price if > 0, else kept
    total_price  = sale_price * quantity
    brand/description replaced only when the write carries a non-empty value
    weight       kept as inserted (the write's weight is not applied)
*/
class ResultLedger {
 public:
  explicit ResultLedger(std::shared_ptr<db::ResultsRepository> repository);

  // Throws util::InvalidArgument on empty artikul/client or negative quantity.
  UpsertOutcome UpsertResult(const ResultWrite& write);

  std::optional<db::model::ResultRecord> GetResult(int64_t id);

  // Newest first; `client` is matched case-insensitively.
  std::vector<db::model::ResultRecord> ListResults(const std::optional<std::string>& client = std::nullopt);

  // Returns false when the patch names no editable field.
  // Throws util::NotFound when no row has this id.
  bool UpdateResult(int64_t id, const db::model::ResultPatch& patch);

  // Throws util::NotFound when no row has this id.
  void DeleteResult(int64_t id);

  int64_t ClearResults(const std::optional<std::string>& client = std::nullopt);

  std::vector<std::string> ListClients();

  // All rows grouped by stored client name, for export collaborators.
  std::map<std::string, std::vector<db::model::ResultRecord>> ExportByClient();

 private:
  std::shared_ptr<db::ResultsRepository> repository_;
};

} // namespace gearledger::ledger

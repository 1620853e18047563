#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace gearledger::db::model {

/*
  One ledger row per (normalized_key, client_key).

  normalized_key and client_key are derived from artikul/client and kept in
  indexed columns so the uniqueness invariant is enforced by the store.
*/
struct ResultRecord {
  int64_t     id = 0;
  std::string artikul;
  std::string normalized_key;
  std::string client;
  std::string client_key;
  int64_t     quantity    = 0;
  double      weight      = 0.0;
  std::string brand;
  std::string description;
  double      sale_price  = 0.0;
  double      total_price = 0.0;
  std::string last_updated;
  std::string created_at;
};

// Sparse update restricted to the editable columns.
struct ResultPatch {
  std::optional<std::string> artikul;
  std::optional<std::string> client;
  std::optional<int64_t>     quantity;
  std::optional<double>      weight;
  std::optional<std::string> brand;
  std::optional<std::string> description;
  std::optional<double>      sale_price;
  std::optional<double>      total_price;

  bool Empty() const {
    return !artikul && !client && !quantity && !weight && !brand && !description && !sale_price && !total_price;
  }
};

} // namespace gearledger::db::model

#pragma once

#include <string>
#include <utility>

namespace gearledger::db {

/*
  Outcome of a single ledger statement.

  SqliteRepository folds sqlite3 return codes into these; ResultLedger maps
  them onto util:: exceptions. Nothing above the repository sees sqlite3.
*/
enum class ErrorCode {
  kOk = 0,
  kNotFound,      // no row has the requested id
  kBusy,          // lock not acquired within busy_timeout
  kDuplicateKey,  // (normalized_key, client_key) already taken
  kStorage,       // I/O failure or a damaged database file
  kInternal,
};

struct Result {
  ErrorCode   code = ErrorCode::kOk;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::kOk;
  }
};

} // namespace gearledger::db

#pragma once

#include <string>
#include <utility>

namespace gearledger::sync::client {

/*
  Result of a client call. The client never throws across its public API:
  transport failures, timeouts and server-side errors all land in `error`.
*/
template <typename T>
struct Outcome {
  bool        ok = false;
  std::string error;
  T           value{};

  static Outcome Success(T v) {
    Outcome out;
    out.ok    = true;
    out.value = std::move(v);
    return out;
  }

  static Outcome Failure(std::string message) {
    Outcome out;
    out.error = std::move(message);
    return out;
  }

  explicit operator bool() const {
    return ok;
  }
};

} // namespace gearledger::sync::client

#pragma once

#include <exception>
#include <string>

#include "internal/util/errors.hpp"

namespace gearledger::http {

/*
  Converts internal exceptions into HTTP status codes and the
  `{"ok":false,"error":...}` body.
*/

struct HttpError {
  int         status;
  std::string body;
};

int ToStatus(const std::exception& e);

HttpError ToHttpError(const std::exception& e);

std::string ErrorBody(const std::string& message);

// Message for error responses the server produces before any route runs
// (unknown path, oversized or malformed request).
std::string StatusMessage(int status);

} // namespace gearledger::http

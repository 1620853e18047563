#include "http_error.hpp"

#include "gearledger/sync/v1.hpp"
#include "internal/util/json.hpp"

namespace gearledger::http {

int ToStatus(const std::exception& e) {
  using namespace gearledger::util;

  if (dynamic_cast<const InvalidArgument*>(&e)) {
    return 400;
  }
  if (dynamic_cast<const NotFound*>(&e)) {
    return 404;
  }
  if (dynamic_cast<const AlreadyExists*>(&e)) {
    return 409;
  }
  if (dynamic_cast<const PayloadTooLarge*>(&e)) {
    return 413;
  }
  if (dynamic_cast<const Unavailable*>(&e)) {
    return 503;
  }

  return 500;
}

HttpError ToHttpError(const std::exception& e) {
  return {ToStatus(e), ErrorBody(e.what())};
}

std::string ErrorBody(const std::string& message) {
  gearledger::sync::v1::ErrorResponse resp;
  resp.set_ok(false);
  resp.set_error(message);
  return gearledger::util::ToJson(resp);
}

std::string StatusMessage(int status) {
  switch (status) {
    case 400:
      return "Bad request";
    case 404:
      return "Not found";
    case 413:
      return "Request body too large";
    case 414:
      return "Request URI too long";
    case 503:
      return "Service unavailable";
    default:
      return status >= 500 ? "Internal server error" : "Request failed";
  }
}

} // namespace gearledger::http

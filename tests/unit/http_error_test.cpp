#include "gearledger/sync/v1.hpp"
#include "internal/http/http_error.hpp"
#include "internal/http/sse.hpp"
#include "internal/util/json.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>

namespace {

using namespace gearledger::http;

void TestExceptionStatuses() {
  using namespace gearledger::util;

  assert(ToStatus(InvalidArgument("bad")) == 400);
  assert(ToStatus(NotFound("gone")) == 404);
  assert(ToStatus(AlreadyExists("dup")) == 409);
  assert(ToStatus(PayloadTooLarge("big")) == 413);
  assert(ToStatus(Unavailable("busy")) == 503);
  assert(ToStatus(std::runtime_error("boom")) == 500);
}

void TestErrorBodyShape() {
  const auto error = ToHttpError(gearledger::util::InvalidArgument("No data provided"));
  assert(error.status == 400);

  gearledger::sync::v1::ErrorResponse decoded;
  assert(gearledger::util::TryFromJson(error.body, &decoded));
  assert(!decoded.ok());
  assert(decoded.error() == "No data provided");
  assert(error.body.find("\"ok\":false") != std::string::npos);
}

void TestServerGeneratedMessages() {
  assert(StatusMessage(404) == "Not found");
  assert(StatusMessage(413) == "Request body too large");
  assert(StatusMessage(400) == "Bad request");
  assert(StatusMessage(502) == "Internal server error");
}

void TestSseFraming() {
  assert(SseData(R"({"type":"connected"})") == "data: {\"type\":\"connected\"}\n\n");
  assert(kSseKeepalive == ": keepalive\n\n");
}

} // namespace

int main() {
  TestExceptionStatuses();
  TestErrorBodyShape();
  TestServerGeneratedMessages();
  TestSseFraming();

  std::cout << "http_error: pass\n";
  return 0;
}

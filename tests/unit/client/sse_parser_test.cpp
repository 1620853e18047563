#include "client/cpp/event_stream_client.h"
#include "client/cpp/http_client.h"
#include "client/cpp/sse_parser.h"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

namespace {

using gearledger::sync::client::SseParser;

void TestSingleEvent() {
  SseParser parser;
  const auto events = parser.Feed("data: {\"type\":\"connected\",\"version\":0}\n\n");
  assert(events.size() == 1);
  assert(events[0] == "{\"type\":\"connected\",\"version\":0}");
}

void TestChunksSplitAnywhere() {
  SseParser         parser;
  const std::string stream = "data: {\"a\":1}\r\n\r\n: keepalive\n\ndata:{\"b\":2}\n\n";

  std::vector<std::string> events;
  for (const char c : stream) {
    for (auto& event : parser.Feed(std::string(1, c))) {
      events.push_back(std::move(event));
    }
  }
  assert(events.size() == 2);
  assert(events[0] == "{\"a\":1}");
  assert(events[1] == "{\"b\":2}");
}

void TestMultiLineDataAndIgnoredFields() {
  SseParser  parser;
  const auto events = parser.Feed("event: update\nid: 7\ndata: line1\ndata: line2\nretry: 10\n\n");
  assert(events.size() == 1);
  assert(events[0] == "line1\nline2");
}

void TestCommentsAloneProduceNothing() {
  SseParser parser;
  assert(parser.Feed(": keepalive\n\n").empty());
  assert(parser.Feed("\n\n").empty());
}

void TestResetDropsPartialEvent() {
  SseParser parser;
  assert(parser.Feed("data: partial").empty());
  parser.Reset();
  const auto events = parser.Feed("data: fresh\n\n");
  assert(events.size() == 1);
  assert(events[0] == "fresh");
}

void TestServerUrlParsing() {
  using gearledger::sync::client::ParseServerUrl;

  const auto full = ParseServerUrl("http://192.168.1.20:9000/");
  assert(full && full->host == "192.168.1.20" && full->port == 9000);

  const auto defaulted = ParseServerUrl("http://warehouse.local");
  assert(defaulted && defaulted->host == "warehouse.local" && defaulted->port == 8080);

  const auto bare = ParseServerUrl("10.0.0.1:8081");
  assert(bare && bare->host == "10.0.0.1" && bare->port == 8081);

  assert(!ParseServerUrl("").has_value());
}

void TestEventDispatch() {
  using namespace gearledger::sync;

  std::vector<std::string> types;
  int32_t                  results_version = -1;
  std::vector<std::string> catalogs;

  client::EventStreamCallbacks callbacks;
  callbacks.on_event            = [&](const std::string& type, const std::string&) { types.push_back(type); };
  callbacks.on_results_changed  = [&](const v1::ResultsChangedEvent& e) { results_version = e.version(); };
  callbacks.on_catalog_uploaded = [&](const v1::CatalogUploadedEvent& e) { catalogs.push_back(e.filename()); };

  client::EventStreamClient stream("http://127.0.0.1:1", callbacks);

  stream.HandleEvent(R"({"type":"connected","version":3})");
  assert(catalogs.empty());

  stream.HandleEvent(R"({"type":"connected","version":4,"catalog":{"filename":"parts.xlsx","size":500,"version":4}})");
  assert(catalogs.size() == 1 && catalogs[0] == "parts.xlsx");

  stream.HandleEvent(R"({"type":"results_changed","version":9})");
  assert(results_version == 9);

  stream.HandleEvent(R"({"type":"catalog_uploaded","filename":"v2.xlsx","size":10,"version":10})");
  assert(catalogs.size() == 2 && catalogs[1] == "v2.xlsx");

  stream.HandleEvent("not json");
  stream.HandleEvent(R"({"type":"future_event"})");

  assert(types.size() == 5);
  assert(types[0] == "connected");
  assert(types[4] == "future_event");
  assert(!stream.IsConnected());
}

} // namespace

int main() {
  TestSingleEvent();
  TestChunksSplitAnywhere();
  TestMultiLineDataAndIgnoredFields();
  TestCommentsAloneProduceNothing();
  TestResetDropsPartialEvent();
  TestServerUrlParsing();
  TestEventDispatch();

  std::cout << "gearledger_unit_sse_parser: pass\n";
  return 0;
}

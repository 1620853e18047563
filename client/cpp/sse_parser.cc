#include "client/cpp/sse_parser.h"

namespace gearledger::sync::client {

std::vector<std::string> SseParser::Feed(std::string_view chunk) {
  std::vector<std::string> events;
  for (const char c : chunk) {
    if (c != '\n') {
      line_.push_back(c);
      continue;
    }
    if (!line_.empty() && line_.back() == '\r') {
      line_.pop_back();
    }
    ProcessLine(line_, &events);
    line_.clear();
  }
  return events;
}

void SseParser::Reset() {
  line_.clear();
  data_.clear();
  has_data_ = false;
}

void SseParser::ProcessLine(std::string_view line, std::vector<std::string>* out) {
  if (line.empty()) {
    if (has_data_) {
      out->push_back(std::move(data_));
    }
    data_.clear();
    has_data_ = false;
    return;
  }
  if (line.front() == ':') {
    return;
  }

  const auto colon = line.find(':');
  const auto field = line.substr(0, colon);
  if (field != "data") {
    return;
  }

  auto value = colon == std::string_view::npos ? std::string_view{} : line.substr(colon + 1);
  if (!value.empty() && value.front() == ' ') {
    value.remove_prefix(1);
  }
  if (has_data_) {
    data_.push_back('\n');
  }
  data_.append(value);
  has_data_ = true;
}

} // namespace gearledger::sync::client

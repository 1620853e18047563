#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace gearledger::sync::client {

/*
  Incremental text/event-stream decoder. Feed() accepts arbitrary byte
  chunks and returns the `data` payload of every event completed by a blank
  line. Comment lines (keepalives) and other fields are skipped; several
  `data:` lines of one event are joined with '\n'.
*/
class SseParser {
 public:
  std::vector<std::string> Feed(std::string_view chunk);

  void Reset();

 private:
  void ProcessLine(std::string_view line, std::vector<std::string>* out);

  std::string line_;
  std::string data_;
  bool        has_data_ = false;
};

} // namespace gearledger::sync::client

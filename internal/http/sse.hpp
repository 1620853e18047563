#pragma once

#include <string>
#include <string_view>

namespace gearledger::http {

inline constexpr std::string_view kSseKeepalive = ": keepalive\n\n";

// One SSE frame carrying a single-line JSON payload.
inline std::string SseData(std::string_view payload) {
  std::string frame;
  frame.reserve(payload.size() + 8);
  frame.append("data: ");
  frame.append(payload);
  frame.append("\n\n");
  return frame;
}

} // namespace gearledger::http

#include "artikul.hpp"

#include <cctype>

namespace gearledger::util {

std::string NormalizeArtikul(std::string_view artikul) {
  std::string out;
  out.reserve(artikul.size());
  for (unsigned char c : artikul) {
    if (std::isspace(c) || c == '-' || c == '.') {
      continue;
    }
    out.push_back(static_cast<char>(std::toupper(c)));
  }
  return out;
}

std::string ToUpper(std::string_view value) {
  std::string out(value);
  for (auto& c : out) {
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  return out;
}

} // namespace gearledger::util

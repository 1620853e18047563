#pragma once

#include <string>
#include <string_view>

namespace gearledger::util {

// Matching key for part codes: whitespace, '-' and '.' removed, upper-cased.
// "PK-5396", "pk5396" and "PK 5396" all normalize to "PK5396".
std::string NormalizeArtikul(std::string_view artikul);

// ASCII upper-case, used for case-insensitive client comparison.
std::string ToUpper(std::string_view value);

} // namespace gearledger::util

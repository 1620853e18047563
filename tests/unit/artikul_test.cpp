#include "internal/util/artikul.hpp"

#include <cassert>
#include <iostream>

namespace {

void TestSpellingsShareOneKey() {
  using gearledger::util::NormalizeArtikul;

  assert(NormalizeArtikul("PK-5396") == "PK5396");
  assert(NormalizeArtikul("pk5396") == "PK5396");
  assert(NormalizeArtikul("PK 5396") == "PK5396");
  assert(NormalizeArtikul(" pk.53-96\t") == "PK5396");
}

void TestOtherCharactersAreKept() {
  using gearledger::util::NormalizeArtikul;

  assert(NormalizeArtikul("A/B_12") == "A/B_12");
  assert(NormalizeArtikul("---").empty());
  assert(NormalizeArtikul("").empty());
}

void TestClientKeyIsCaseInsensitive() {
  using gearledger::util::ToUpper;

  assert(ToUpper("Acme") == ToUpper("ACME"));
  assert(ToUpper("acme gmbh") == "ACME GMBH");
}

} // namespace

int main() {
  TestSpellingsShareOneKey();
  TestOtherCharactersAreKept();
  TestClientKeyIsCaseInsensitive();

  std::cout << "gearledger_unit_artikul: pass\n";
  return 0;
}

#include "internal/ledger/canonical_json.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/model/money.hpp"
#include "internal/util/errors.hpp"

namespace {

using nlohmann::json;
using settle::ledger::Canonicalize;

bool RejectsWithValidationError(const json& value) {
  try {
    (void)Canonicalize(value);
  } catch (const settle::util::ValidationError&) {
    return true;
  }
  return false;
}

void TestKeysAreSortedWithoutWhitespace() {
  const json object = {{"participant_id", 7}, {"description", "x"}, {"amount_eur", 2.8}, {"batch_id", 1}};
  assert(Canonicalize(object) == R"({"amount_eur":2.8,"batch_id":1,"description":"x","participant_id":7})");
}

void TestNestedObjectsCompose() {
  const json object = {{"z", {{"b", true}, {"a", 0.15}}}, {"a", "first"}};
  assert(Canonicalize(object) == R"({"a":"first","z":{"a":0.15,"b":true}})");
  assert(Canonicalize(json::object()) == "{}");
}

void TestEverythingOutsidePrintableAsciiIsEscaped() {
  assert(Canonicalize("Grundgeb\xC3\xBChr") == R"("Grundgeb\u00fchr")");
  assert(Canonicalize("\xF0\x9F\x98\x80") == R"("\ud83d\ude00")");
  assert(Canonicalize("a\x7f" "b") == R"("a\u007fb")");
  assert(Canonicalize("a\"b\\c/d") == R"("a\"b\\c/d")");
  assert(Canonicalize(std::string("\x01\n", 2)) == R"("\u0001\n")");
}

void TestInvalidUtf8IsRejected() {
  assert(RejectsWithValidationError("\xC3") && "Truncated UTF-8 must be rejected.");
  assert(RejectsWithValidationError("\xC0\xAF") && "Overlong UTF-8 must be rejected.");
  assert(RejectsWithValidationError({{"description", "ok\xFF"}}));
}

void TestDoublesKeepAFractionalPart() {
  assert(Canonicalize(5.0) == "5.0");
  assert(Canonicalize(0.15) == "0.15");
  assert(Canonicalize(0.0) == "0.0");
  assert(Canonicalize(1e-9) == "1e-09");
}

void TestCentAmountsPrintAsTheirDecimal() {
  assert(Canonicalize(settle::model::ToEur(280)) == "2.8");
  assert(Canonicalize(settle::model::ToEur(-5)) == "-0.05");
  assert(Canonicalize(settle::model::ToEur(1200)) == "12.0");
  assert(Canonicalize(settle::model::ToEur(-153)) == "-1.53");
  assert(Canonicalize(settle::model::ToEur(123456789)) == "1234567.89");
}

} // namespace

int main() {
  TestKeysAreSortedWithoutWhitespace();
  TestNestedObjectsCompose();
  TestEverythingOutsidePrintableAsciiIsEscaped();
  TestInvalidUtf8IsRejected();
  TestDoublesKeepAFractionalPart();
  TestCentAmountsPrintAsTheirDecimal();

  std::cout << "settle_unit_canonical_json: pass\n";
  return 0;
}

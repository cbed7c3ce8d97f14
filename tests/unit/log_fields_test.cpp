#include "internal/observability/logging.hpp"

#include <cassert>
#include <iostream>

namespace {

using settle::observability::BoolField;
using settle::observability::EurField;
using settle::observability::FormatFields;
using settle::observability::IntField;
using settle::observability::StringField;

void TestPlainValuesStayBare() {
  assert(FormatFields({IntField("batch_id", 7), StringField("use_case", "mieterstrom"), BoolField("retryable", false)}) ==
         "batch_id=7 use_case=mieterstrom retryable=false");
  assert(FormatFields({}).empty());
}

void TestValuesThatWouldSplitAreQuoted() {
  assert(FormatFields({StringField("error", "window start is not before end")}) == R"(error="window start is not before end")");
  assert(FormatFields({StringField("error", R"(bad "x")")}) == R"(error="bad \"x\"")");
  assert(FormatFields({StringField("path", R"(C:\settle)")}) == R"(path="C:\\settle")");
  assert(FormatFields({StringField("expr", "a=b")}) == R"(expr="a=b")");
  assert(FormatFields({StringField("name", "")}) == R"(name="")");
}

void TestEurFieldUsesTwoDecimals() {
  assert(FormatFields({EurField("suppressed_eur", 27)}) == "suppressed_eur=0.27");
  assert(FormatFields({EurField("amount_eur", -280)}) == "amount_eur=-2.80");
}

} // namespace

int main() {
  TestPlainValuesStayBare();
  TestValuesThatWouldSplitAreQuoted();
  TestEurFieldUsesTwoDecimals();

  std::cout << "settle_unit_log_fields: pass\n";
  return 0;
}

#include "cmd/settlectl/args.hpp"

#include <cassert>
#include <iostream>

namespace {

using settlectl::ParseBatchId;

void TestWholeDecimalIdsParse() {
  assert(ParseBatchId("7") == 7);
  assert(ParseBatchId("9223372036854775807") == 9223372036854775807LL);
}

void TestMalformedIdsAreRejected() {
  assert(!ParseBatchId("").has_value());
  assert(!ParseBatchId("abc").has_value());
  assert(!ParseBatchId("12abc").has_value());
  assert(!ParseBatchId(" 12").has_value());
  assert(!ParseBatchId("+12").has_value());
  assert(!ParseBatchId("0").has_value());
  assert(!ParseBatchId("-3").has_value());
  assert(!ParseBatchId("9223372036854775808").has_value());
}

} // namespace

int main() {
  TestWholeDecimalIdsParse();
  TestMalformedIdsAreRejected();

  std::cout << "settle_unit_settlectl_args: pass\n";
  return 0;
}

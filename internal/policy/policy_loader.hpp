#pragma once

#include <string>
#include <string_view>

#include "internal/policy/policy.hpp"

namespace settle::policy {

/*
  Validates a raw policy against the schema of its use case.

  Rejected with util::ValidationError naming the offending key:
    - unknown use case or parameter
    - number given where a string is expected (and vice versa)
    - negative or non-finite prices, rates or shares outside [0, 1]
    - unknown rounding mode / unclassified source treatment / role suffix
*/
Policy LoadPolicy(const RawPolicy& raw);

// Every recognised parameter of the use case with its default value.
RawPolicy DefaultPolicy(UseCase use_case);

// Resolved parameters rendered as canonical JSON, persisted with each batch.
std::string ToCanonicalJson(const Policy& policy);

// Fully resolved parameter map, defaults included. LoadPolicy(ToRawPolicy(p))
// yields p again.
RawPolicy ToRawPolicy(const Policy& policy);

} // namespace settle::policy

#pragma once

#include <string>

#include <nlohmann/json.hpp>

namespace settle::ledger {

/*
  Canonical JSON text, the exact bytes a hash is computed over:
    - object keys in byte order (nlohmann::json objects are ordered maps)
    - no whitespace between tokens
    - control characters and every code point from 0x7F up escaped as
      \uXXXX, surrogate pairs beyond the BMP
    - doubles in shortest round-trip form with a fractional part
      ("2.8", "5.0", "1e-09")

  Throws util::ValidationError when a string is not valid UTF-8.
*/
std::string Canonicalize(const nlohmann::json& value);

} // namespace settle::ledger

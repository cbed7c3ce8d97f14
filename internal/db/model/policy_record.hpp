#pragma once

#include <cstdint>
#include <string>

namespace settle::db::model {

// Resolved policy a batch was computed with, as canonical JSON.
struct PolicyRecord {
  std::int64_t id = 0;
  std::string  use_case;
  std::string  body_json;
  std::int64_t created_at_ms = 0;
};

} // namespace settle::db::model

#pragma once

#include <cstdint>
#include <string>

namespace settle::db::model {

/*
  Append-only. Window is half-open [start_ms, end_ms).
*/
struct SettlementBatchRecord {
  std::int64_t id = 0;
  std::string  use_case;
  std::int64_t start_ms      = 0;
  std::int64_t end_ms        = 0;
  std::int64_t created_at_ms = 0;
  std::int64_t policy_id     = 0;
};

} // namespace settle::db::model

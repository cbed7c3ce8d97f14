#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/usage_event.hpp"

namespace settle::db::model {

struct UsageEventRecord {
  std::int64_t             id             = 0;
  std::int64_t             participant_id = 0;
  settle::model::EventKind kind           = settle::model::EventKind::kUnspecified;
  double                   quantity       = 0.0;
  settle::model::Unit      unit           = settle::model::Unit::kUnspecified;
  std::int64_t             timestamp_ms   = 0;
  std::string              source;
  std::optional<double>    price_per_unit;
};

} // namespace settle::db::model

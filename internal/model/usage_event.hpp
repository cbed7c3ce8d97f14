#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "internal/model/participant.hpp"
#include "internal/util/time.hpp"

namespace settle::model {

using EventId = std::int64_t;

enum class EventKind : std::uint8_t {
  kUnspecified      = 0,
  kGeneration       = 1,
  kConsumption      = 2,
  kGridFeed         = 3,
  kBaseFee          = 4,
  kBatteryCharge    = 5,
  kBatteryDischarge = 6,
  kProduction       = 7,
  kVppSale          = 8,
};

enum class Unit : std::uint8_t {
  kUnspecified = 0,
  kKwh         = 1,
  kEur         = 2,
};

enum class SourceBucket : std::uint8_t {
  kLocal,
  kGrid,
  kUnclassified,
};

constexpr std::string_view ToString(EventKind kind) {
  switch (kind) {
    case EventKind::kGeneration:
      return "generation";
    case EventKind::kConsumption:
      return "consumption";
    case EventKind::kGridFeed:
      return "grid_feed";
    case EventKind::kBaseFee:
      return "base_fee";
    case EventKind::kBatteryCharge:
      return "battery_charge";
    case EventKind::kBatteryDischarge:
      return "battery_discharge";
    case EventKind::kProduction:
      return "production";
    case EventKind::kVppSale:
      return "vpp_sale";
    case EventKind::kUnspecified:
    default:
      return "unspecified";
  }
}

constexpr std::string_view ToString(Unit unit) {
  switch (unit) {
    case Unit::kKwh:
      return "kWh";
    case Unit::kEur:
      return "EUR";
    case Unit::kUnspecified:
    default:
      return "unspecified";
  }
}

std::optional<EventKind> ParseEventKind(std::string_view value);
std::optional<Unit>      ParseUnit(std::string_view value);

// trim, lower-case, '-' and ' ' become '_'
std::string  NormalizeSource(std::string_view source);
SourceBucket ClassifySource(std::string_view normalized_source);

struct UsageEvent {
  EventId               id             = 0;
  ParticipantId         participant_id = 0;
  EventKind             kind           = EventKind::kUnspecified;
  double                quantity       = 0.0;
  Unit                  unit           = Unit::kUnspecified;
  util::TimePoint       timestamp{};
  std::string           source;
  std::optional<double> price_per_unit;
};

} // namespace settle::model

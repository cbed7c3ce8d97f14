#include "usage_event.hpp"

#include <cctype>

namespace settle::model {

std::optional<EventKind> ParseEventKind(std::string_view value) {
  const auto normalized = NormalizeSource(value);
  if (normalized == "generation") return EventKind::kGeneration;
  if (normalized == "consumption") return EventKind::kConsumption;
  if (normalized == "grid_feed") return EventKind::kGridFeed;
  if (normalized == "base_fee") return EventKind::kBaseFee;
  if (normalized == "battery_charge") return EventKind::kBatteryCharge;
  if (normalized == "battery_discharge") return EventKind::kBatteryDischarge;
  if (normalized == "production") return EventKind::kProduction;
  if (normalized == "vpp_sale") return EventKind::kVppSale;
  return std::nullopt;
}

std::optional<Unit> ParseUnit(std::string_view value) {
  const auto normalized = NormalizeSource(value);
  if (normalized == "kwh") return Unit::kKwh;
  if (normalized == "eur") return Unit::kEur;
  return std::nullopt;
}

std::string NormalizeSource(std::string_view source) {
  std::size_t begin = 0;
  std::size_t end   = source.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(source[begin]))) ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(source[end - 1]))) --end;

  std::string out;
  out.reserve(end - begin);
  for (std::size_t i = begin; i < end; ++i) {
    const char c = source[i];
    if (c == '-' || c == ' ') {
      out.push_back('_');
    } else {
      out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
  }
  return out;
}

SourceBucket ClassifySource(std::string_view normalized_source) {
  if (normalized_source == "local_pv" || normalized_source == "pv" || normalized_source == "battery" || normalized_source == "local_battery") {
    return SourceBucket::kLocal;
  }
  if (normalized_source == "grid" || normalized_source == "grid_import" || normalized_source == "utility" || normalized_source == "external") {
    return SourceBucket::kGrid;
  }
  return SourceBucket::kUnclassified;
}

} // namespace settle::model

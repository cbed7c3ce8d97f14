#include "explanation.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>

namespace settle::audit {

UsageSummary Summarize(const std::vector<model::UsageEvent>& events, model::ParticipantId participant_id) {
  UsageSummary summary;
  for (const auto& event : events) {
    if (event.participant_id != participant_id) continue;
    ++summary.events;

    const bool kwh = event.unit == model::Unit::kKwh;
    switch (event.kind) {
      case model::EventKind::kConsumption:
        if (!kwh) break;
        if (model::ClassifySource(model::NormalizeSource(event.source)) == model::SourceBucket::kLocal) {
          summary.local_supply_kwh += event.quantity;
        } else {
          summary.grid_supply_kwh += event.quantity;
        }
        break;
      case model::EventKind::kGeneration:
      case model::EventKind::kProduction:
        if (kwh) summary.generated_kwh += event.quantity;
        break;
      case model::EventKind::kGridFeed:
        if (kwh) summary.fed_in_kwh += event.quantity;
        break;
      case model::EventKind::kBaseFee:
        if (event.unit == model::Unit::kEur) {
          summary.base_fees_eur += event.quantity;
        } else {
          summary.base_fee_units += event.quantity;
        }
        break;
      case model::EventKind::kBatteryCharge:
        if (kwh) summary.battery_charge_kwh += event.quantity;
        break;
      case model::EventKind::kBatteryDischarge:
        if (kwh) summary.battery_discharge_kwh += event.quantity;
        break;
      case model::EventKind::kVppSale:
        if (kwh) summary.market_sale_kwh += event.quantity;
        break;
      case model::EventKind::kUnspecified:
      default:
        break;
    }
  }
  return summary;
}

std::string_view RoleTitle(model::Role role) {
  switch (role) {
    case model::Role::kConsumer:
      return "Verbraucher";
    case model::Role::kTenant:
      return "Mieter";
    case model::Role::kCommercialTenant:
      return "Gewerbemieter";
    case model::Role::kLandlord:
      return "Vermieter";
    case model::Role::kOperator:
      return "Betreiber";
    case model::Role::kProsumer:
      return "Prosumer";
    case model::Role::kExternalMarket:
      return "Externer Markt";
    case model::Role::kFeeCollector:
      return "Gemeinschaftskasse";
    case model::Role::kUnspecified:
    default:
      return "Unbekannt";
  }
}

std::string Explain(std::string_view name, model::Role role, model::Cents amount, const UsageSummary& usage) {
  std::string text = fmt::format("{} ({}): ", name, RoleTitle(role));

  if (usage.events == 0) {
    text += "keine Events im Zeitraum. ";
  } else {
    std::vector<std::string> parts;
    if (usage.local_supply_kwh > 0) parts.push_back(fmt::format("{:.1f} kWh lokaler Strom", usage.local_supply_kwh));
    if (usage.grid_supply_kwh > 0) parts.push_back(fmt::format("{:.1f} kWh Netzstrom", usage.grid_supply_kwh));
    if (usage.generated_kwh > 0) parts.push_back(fmt::format("{:.1f} kWh erzeugt", usage.generated_kwh));
    if (usage.fed_in_kwh > 0) parts.push_back(fmt::format("{:.1f} kWh eingespeist", usage.fed_in_kwh));
    if (usage.market_sale_kwh > 0) parts.push_back(fmt::format("{:.1f} kWh am Markt verkauft", usage.market_sale_kwh));
    if (usage.battery_charge_kwh > 0) parts.push_back(fmt::format("{:.1f} kWh Batterie geladen", usage.battery_charge_kwh));
    if (usage.battery_discharge_kwh > 0) parts.push_back(fmt::format("{:.1f} kWh Batterie entladen", usage.battery_discharge_kwh));
    if (usage.base_fees_eur > 0) parts.push_back(fmt::format("{:.2f} EUR Grundgebühr", usage.base_fees_eur));
    if (usage.base_fee_units > 0) parts.push_back(fmt::format("{:.0f} Grundgebühr-Einheiten", usage.base_fee_units));

    if (parts.empty()) {
      text += "keine relevanten Aktivitäten. ";
    } else {
      text += fmt::format("{}. ", fmt::join(parts, ", "));
    }
  }

  if (amount > 0) {
    text += fmt::format("Zahlt {} EUR.", model::FormatEur(amount));
  } else if (amount < 0) {
    text += fmt::format("Erhält {} EUR.", model::FormatEur(-amount));
  } else {
    text += "Ausgeglichen (0 EUR).";
  }
  return text;
}

} // namespace settle::audit

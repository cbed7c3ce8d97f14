#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "internal/model/money.hpp"
#include "internal/model/participant.hpp"

namespace settle::policy {

enum class UseCase : std::uint8_t {
  kEnergyCommunity,
  kMieterstrom,
  kVirtualPowerPlant,
};

std::optional<UseCase> ParseUseCase(std::string_view value);
std::string_view       ToString(UseCase use_case);
std::string_view       Title(UseCase use_case);

// ---------------------------------------------------------------------------
// Raw (unvalidated) policy as it arrives from a request
// ---------------------------------------------------------------------------

using ParameterValue = std::variant<double, std::string>;

struct RawPolicy {
  std::string                           use_case;
  std::map<std::string, ParameterValue> parameters;
};

// ---------------------------------------------------------------------------
// Validated policy
// ---------------------------------------------------------------------------

// Prices in EUR/kWh, rates and shares in [0, 1].
struct EnergyCommunityTerms {
  double prosumer_sell_price = 0.15;
  double consumer_buy_price  = 0.12;
  double community_fee_rate  = 0.02;
  double grid_feed_price     = 0.08;
  double grid_price_per_kwh  = 0.30;
};

struct MieterstromTerms {
  double tenant_price_per_kwh   = 0.18;
  double landlord_revenue_share = 0.60;
  double operator_fee_rate      = 0.15;
  double grid_compensation      = 0.08;
  double base_fee_per_unit      = 5.00;
  double grid_price_per_kwh     = 0.32;
};

struct VirtualPowerPlantTerms {
  double market_price_per_kwh = 0.10;
  double aggregator_fee_rate  = 0.05;
};

using Terms = std::variant<EnergyCommunityTerms, MieterstromTerms, VirtualPowerPlantTerms>;

enum class UnclassifiedSource : std::uint8_t {
  kGrid,   // treat as grid supply
  kZero,   // no posting, counted as unpriced
  kReject, // fail the run
};

std::string_view ToString(UnclassifiedSource treatment);

struct NettingParameters {
  model::RoundingMode           rounding_mode  = model::RoundingMode::kHalfUp;
  double                        zero_epsilon   = 1e-9;
  double                        min_payout_eur = 0.0;
  std::map<model::Role, double> min_payout_by_role;

  double MinPayoutFor(model::Role role) const {
    auto it = min_payout_by_role.find(role);
    return it == min_payout_by_role.end() ? min_payout_eur : it->second;
  }
};

struct Policy {
  UseCase            use_case = UseCase::kEnergyCommunity;
  Terms              terms;
  NettingParameters  netting;
  UnclassifiedSource unclassified_source = UnclassifiedSource::kGrid;
};

} // namespace settle::policy

#include "policy_loader.hpp"

#include <cmath>
#include <type_traits>
#include <vector>

#include <spdlog/fmt/fmt.h>

#include "internal/ledger/canonical_json.hpp"
#include "internal/util/errors.hpp"

namespace settle::policy {

namespace {

constexpr std::string_view kMinPayoutPrefix = "min_payout_eur.";

// Zero epsilon must stay below half a cent or it would swallow real amounts.
constexpr double kMaxZeroEpsilon = 0.005;

enum class Bound : std::uint8_t {
  kNonNegative,
  kUnitInterval,
};

template <typename T>
struct TermField {
  std::string_view name;
  double T::*      member;
  Bound            bound;
};

template <typename T>
const std::vector<TermField<T>>& TermFields();

template <>
const std::vector<TermField<EnergyCommunityTerms>>& TermFields<EnergyCommunityTerms>() {
  static const std::vector<TermField<EnergyCommunityTerms>> kFields = {
      {"prosumer_sell_price", &EnergyCommunityTerms::prosumer_sell_price, Bound::kNonNegative},
      {"consumer_buy_price", &EnergyCommunityTerms::consumer_buy_price, Bound::kNonNegative},
      {"community_fee_rate", &EnergyCommunityTerms::community_fee_rate, Bound::kUnitInterval},
      {"grid_feed_price", &EnergyCommunityTerms::grid_feed_price, Bound::kNonNegative},
      {"grid_price_per_kwh", &EnergyCommunityTerms::grid_price_per_kwh, Bound::kNonNegative},
  };
  return kFields;
}

template <>
const std::vector<TermField<MieterstromTerms>>& TermFields<MieterstromTerms>() {
  static const std::vector<TermField<MieterstromTerms>> kFields = {
      {"tenant_price_per_kwh", &MieterstromTerms::tenant_price_per_kwh, Bound::kNonNegative},
      {"landlord_revenue_share", &MieterstromTerms::landlord_revenue_share, Bound::kUnitInterval},
      {"operator_fee_rate", &MieterstromTerms::operator_fee_rate, Bound::kUnitInterval},
      {"grid_compensation", &MieterstromTerms::grid_compensation, Bound::kNonNegative},
      {"base_fee_per_unit", &MieterstromTerms::base_fee_per_unit, Bound::kNonNegative},
      {"grid_price_per_kwh", &MieterstromTerms::grid_price_per_kwh, Bound::kNonNegative},
  };
  return kFields;
}

template <>
const std::vector<TermField<VirtualPowerPlantTerms>>& TermFields<VirtualPowerPlantTerms>() {
  static const std::vector<TermField<VirtualPowerPlantTerms>> kFields = {
      {"market_price_per_kwh", &VirtualPowerPlantTerms::market_price_per_kwh, Bound::kNonNegative},
      {"aggregator_fee_rate", &VirtualPowerPlantTerms::aggregator_fee_rate, Bound::kUnitInterval},
  };
  return kFields;
}

Terms DefaultTerms(UseCase use_case) {
  switch (use_case) {
    case UseCase::kMieterstrom:
      return MieterstromTerms{};
    case UseCase::kVirtualPowerPlant:
      return VirtualPowerPlantTerms{};
    case UseCase::kEnergyCommunity:
    default:
      return EnergyCommunityTerms{};
  }
}

double RequireNumber(const std::string& key, const ParameterValue& value) {
  const auto* number = std::get_if<double>(&value);
  if (!number) {
    throw util::ValidationError(fmt::format("policy parameter '{}' must be a number", key));
  }
  if (!std::isfinite(*number)) {
    throw util::ValidationError(fmt::format("policy parameter '{}' must be finite", key));
  }
  return *number;
}

const std::string& RequireString(const std::string& key, const ParameterValue& value) {
  const auto* text = std::get_if<std::string>(&value);
  if (!text) {
    throw util::ValidationError(fmt::format("policy parameter '{}' must be a string", key));
  }
  return *text;
}

double CheckBound(const std::string& key, double value, Bound bound) {
  if (value < 0.0) {
    throw util::ValidationError(fmt::format("policy parameter '{}' must not be negative (got {})", key, value));
  }
  if (bound == Bound::kUnitInterval && value > 1.0) {
    throw util::ValidationError(fmt::format("policy parameter '{}' must be within [0, 1] (got {})", key, value));
  }
  return value;
}

std::optional<UnclassifiedSource> ParseUnclassifiedSource(std::string_view value) {
  if (value == "grid") return UnclassifiedSource::kGrid;
  if (value == "zero") return UnclassifiedSource::kZero;
  if (value == "reject") return UnclassifiedSource::kReject;
  return std::nullopt;
}

// Returns false when `key` is not one of the parameters shared by all use cases.
bool ApplyCommon(const std::string& key, const ParameterValue& value, Policy& policy) {
  if (key == "rounding_mode") {
    const auto& text = RequireString(key, value);
    auto        mode = model::ParseRoundingMode(text);
    if (!mode) {
      throw util::ValidationError(fmt::format("policy parameter 'rounding_mode' has unknown value '{}'", text));
    }
    policy.netting.rounding_mode = *mode;
    return true;
  }
  if (key == "zero_epsilon") {
    const double epsilon = CheckBound(key, RequireNumber(key, value), Bound::kNonNegative);
    if (epsilon >= kMaxZeroEpsilon) {
      throw util::ValidationError(fmt::format("policy parameter 'zero_epsilon' must be below {} (got {})", kMaxZeroEpsilon, epsilon));
    }
    policy.netting.zero_epsilon = epsilon;
    return true;
  }
  if (key == "min_payout_eur") {
    policy.netting.min_payout_eur = CheckBound(key, RequireNumber(key, value), Bound::kNonNegative);
    return true;
  }
  if (key.starts_with(kMinPayoutPrefix)) {
    const auto suffix = std::string_view(key).substr(kMinPayoutPrefix.size());
    auto       role   = model::ParseRole(suffix);
    if (!role) {
      throw util::ValidationError(fmt::format("policy parameter '{}' names unknown role '{}'", key, suffix));
    }
    policy.netting.min_payout_by_role[*role] = CheckBound(key, RequireNumber(key, value), Bound::kNonNegative);
    return true;
  }
  if (key == "unclassified_source") {
    const auto& text      = RequireString(key, value);
    auto        treatment = ParseUnclassifiedSource(text);
    if (!treatment) {
      throw util::ValidationError(fmt::format("policy parameter 'unclassified_source' has unknown value '{}' (grid|zero|reject)", text));
    }
    policy.unclassified_source = *treatment;
    return true;
  }
  return false;
}

template <typename T>
bool ApplyTerm(const std::string& key, const ParameterValue& value, T& terms) {
  for (const auto& field : TermFields<T>()) {
    if (field.name == key) {
      terms.*field.member = CheckBound(key, RequireNumber(key, value), field.bound);
      return true;
    }
  }
  return false;
}

} // namespace

std::optional<UseCase> ParseUseCase(std::string_view value) {
  if (value == "energy_community") return UseCase::kEnergyCommunity;
  if (value == "mieterstrom") return UseCase::kMieterstrom;
  if (value == "virtual_power_plant") return UseCase::kVirtualPowerPlant;
  return std::nullopt;
}

std::string_view ToString(UseCase use_case) {
  switch (use_case) {
    case UseCase::kMieterstrom:
      return "mieterstrom";
    case UseCase::kVirtualPowerPlant:
      return "virtual_power_plant";
    case UseCase::kEnergyCommunity:
    default:
      return "energy_community";
  }
}

std::string_view Title(UseCase use_case) {
  switch (use_case) {
    case UseCase::kMieterstrom:
      return "Mieterstrom";
    case UseCase::kVirtualPowerPlant:
      return "Virtuelles Kraftwerk";
    case UseCase::kEnergyCommunity:
    default:
      return "Energie-Community";
  }
}

std::string_view ToString(UnclassifiedSource treatment) {
  switch (treatment) {
    case UnclassifiedSource::kZero:
      return "zero";
    case UnclassifiedSource::kReject:
      return "reject";
    case UnclassifiedSource::kGrid:
    default:
      return "grid";
  }
}

Policy LoadPolicy(const RawPolicy& raw) {
  auto use_case = ParseUseCase(raw.use_case);
  if (!use_case) {
    throw util::ValidationError(fmt::format("unknown use case '{}'", raw.use_case));
  }

  Policy policy;
  policy.use_case = *use_case;
  policy.terms    = DefaultTerms(*use_case);

  for (const auto& [key, value] : raw.parameters) {
    if (key == "use_case") {
      // Tolerated inside the parameter map as long as it agrees.
      if (RequireString(key, value) != raw.use_case) {
        throw util::ValidationError(fmt::format("policy parameter 'use_case' contradicts use case '{}'", raw.use_case));
      }
      continue;
    }
    if (ApplyCommon(key, value, policy)) {
      continue;
    }
    const bool applied = std::visit([&](auto& terms) { return ApplyTerm(key, value, terms); }, policy.terms);
    if (!applied) {
      throw util::ValidationError(fmt::format("unknown policy parameter '{}' for use case '{}'", key, raw.use_case));
    }
  }
  return policy;
}

RawPolicy ToRawPolicy(const Policy& policy) {
  RawPolicy raw;
  raw.use_case = std::string(ToString(policy.use_case));

  raw.parameters["rounding_mode"]       = std::string(model::ToString(policy.netting.rounding_mode));
  raw.parameters["zero_epsilon"]        = policy.netting.zero_epsilon;
  raw.parameters["min_payout_eur"]      = policy.netting.min_payout_eur;
  raw.parameters["unclassified_source"] = std::string(ToString(policy.unclassified_source));
  for (const auto& [role, threshold] : policy.netting.min_payout_by_role) {
    raw.parameters[fmt::format("{}{}", kMinPayoutPrefix, model::ToString(role))] = threshold;
  }

  std::visit(
      [&](const auto& terms) {
        using T = std::decay_t<decltype(terms)>;
        for (const auto& field : TermFields<T>()) {
          raw.parameters[std::string(field.name)] = terms.*field.member;
        }
      },
      policy.terms);
  return raw;
}

RawPolicy DefaultPolicy(UseCase use_case) {
  Policy policy;
  policy.use_case = use_case;
  policy.terms    = DefaultTerms(use_case);
  return ToRawPolicy(policy);
}

std::string ToCanonicalJson(const Policy& policy) {
  const auto raw = ToRawPolicy(policy);

  auto parameters = nlohmann::json::object();
  for (const auto& [key, value] : raw.parameters) {
    if (const auto* number = std::get_if<double>(&value)) {
      parameters[key] = *number;
    } else {
      parameters[key] = std::get<std::string>(value);
    }
  }

  const nlohmann::json root = {{"use_case", raw.use_case}, {"parameters", parameters}};
  return ledger::Canonicalize(root);
}

} // namespace settle::policy

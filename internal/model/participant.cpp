#include "participant.hpp"

#include "usage_event.hpp"

namespace settle::model {

std::optional<Role> ParseRole(std::string_view value) {
  const auto normalized = NormalizeSource(value);
  if (normalized == "consumer") return Role::kConsumer;
  if (normalized == "tenant") return Role::kTenant;
  if (normalized == "commercial_tenant" || normalized == "commercial") return Role::kCommercialTenant;
  if (normalized == "landlord") return Role::kLandlord;
  if (normalized == "operator") return Role::kOperator;
  if (normalized == "prosumer") return Role::kProsumer;
  if (normalized == "external_market" || normalized == "market") return Role::kExternalMarket;
  if (normalized == "fee_collector" || normalized == "community_pool") return Role::kFeeCollector;
  return std::nullopt;
}

std::string_view SyntheticExternalId(Role role) {
  switch (role) {
    case Role::kExternalMarket:
      return "external-market";
    case Role::kFeeCollector:
      return "fee-collector";
    default:
      return {};
  }
}

} // namespace settle::model

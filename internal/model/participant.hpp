#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace settle::model {

using ParticipantId = std::int64_t;

enum class Role : std::uint8_t {
  kUnspecified      = 0,
  kConsumer         = 1,
  kTenant           = 2,
  kCommercialTenant = 3,
  kLandlord         = 4,
  kOperator         = 5,
  kProsumer         = 6,
  kExternalMarket   = 7,
  kFeeCollector     = 8,
};

constexpr std::string_view ToString(Role role) {
  switch (role) {
    case Role::kConsumer:
      return "consumer";
    case Role::kTenant:
      return "tenant";
    case Role::kCommercialTenant:
      return "commercial_tenant";
    case Role::kLandlord:
      return "landlord";
    case Role::kOperator:
      return "operator";
    case Role::kProsumer:
      return "prosumer";
    case Role::kExternalMarket:
      return "external_market";
    case Role::kFeeCollector:
      return "fee_collector";
    case Role::kUnspecified:
    default:
      return "unspecified";
  }
}

// Accepts the canonical names plus a few spellings seen in source data
// ("Commercial-Tenant", "community_pool").
std::optional<Role> ParseRole(std::string_view value);

// Roles the engine creates on demand when a rule needs them as counterparty.
constexpr bool IsSynthetic(Role role) {
  return role == Role::kExternalMarket || role == Role::kFeeCollector;
}

std::string_view SyntheticExternalId(Role role);

struct Participant {
  ParticipantId id = 0;
  std::string   external_id;
  std::string   name;
  Role          role = Role::kUnspecified;
};

} // namespace settle::model

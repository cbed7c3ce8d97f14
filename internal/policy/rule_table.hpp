#pragma once

#include <algorithm>
#include <cstdint>
#include <string_view>
#include <vector>

#include "internal/model/participant.hpp"
#include "internal/model/usage_event.hpp"
#include "internal/policy/policy.hpp"

namespace settle::policy {

enum class Direction : std::uint8_t {
  kCharge, // participant is debited, counterparty credited
  kPay,    // participant is credited, counterparty debited
};

enum class FeeMode : std::uint8_t {
  kNone,
  kSplit,     // fee carved out of the primary amount, paid by the payer side
  kSurcharge, // fee charged to the participant on top of the primary amount
};

enum class SourceMatch : std::uint8_t {
  kAny,
  kLocal,
  kGrid,
};

/*
  One row of a use case's posting table, bound to the use case's terms type
  so prices, shares and fee rates are resolved by member pointer.

  The first rule matching (kind, role, source bucket) wins.
*/
template <typename T>
struct PostingRule {
  std::string_view              name;
  std::vector<model::EventKind> kinds;
  SourceMatch                   source = SourceMatch::kAny;
  std::vector<model::Role>      roles;
  double T::*                   price = nullptr; // default unit price; nullptr means the event must carry one
  double T::*                   share = nullptr;
  Direction                     direction    = Direction::kCharge;
  model::Role                   counterparty = model::Role::kUnspecified;
  FeeMode                       fee_mode     = FeeMode::kNone;
  double T::*                   fee_rate     = nullptr;
  model::Role                   fee_counterparty = model::Role::kUnspecified;

  bool Covers(model::EventKind kind, model::Role role) const {
    return std::find(kinds.begin(), kinds.end(), kind) != kinds.end() && std::find(roles.begin(), roles.end(), role) != roles.end();
  }
};

template <typename T>
const std::vector<PostingRule<T>>& RulesFor();

template <>
const std::vector<PostingRule<EnergyCommunityTerms>>& RulesFor<EnergyCommunityTerms>();
template <>
const std::vector<PostingRule<MieterstromTerms>>& RulesFor<MieterstromTerms>();
template <>
const std::vector<PostingRule<VirtualPowerPlantTerms>>& RulesFor<VirtualPowerPlantTerms>();

} // namespace settle::policy

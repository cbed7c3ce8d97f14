#include "rule_table.hpp"

namespace settle::policy {

namespace {

using model::EventKind;
using model::Role;

const std::vector<Role> kMemberConsumers = {Role::kConsumer, Role::kProsumer, Role::kTenant, Role::kCommercialTenant};
const std::vector<Role> kTenantConsumers = {Role::kTenant, Role::kCommercialTenant, Role::kConsumer};
const std::vector<Role> kAllMembers      = {Role::kConsumer, Role::kTenant, Role::kCommercialTenant, Role::kLandlord, Role::kOperator, Role::kProsumer};
const std::vector<Role> kFlexAssets      = {Role::kProsumer, Role::kOperator};

} // namespace

template <>
const std::vector<PostingRule<EnergyCommunityTerms>>& RulesFor<EnergyCommunityTerms>() {
  using T = EnergyCommunityTerms;
  static const std::vector<PostingRule<T>> kRules = {
      {.name             = "local supply",
       .kinds            = {EventKind::kConsumption},
       .source           = SourceMatch::kLocal,
       .roles            = kMemberConsumers,
       .price            = &T::consumer_buy_price,
       .direction        = Direction::kCharge,
       .counterparty     = Role::kFeeCollector,
       .fee_mode         = FeeMode::kSurcharge,
       .fee_rate         = &T::community_fee_rate,
       .fee_counterparty = Role::kFeeCollector},
      {.name         = "grid supply",
       .kinds        = {EventKind::kConsumption},
       .source       = SourceMatch::kGrid,
       .roles        = kMemberConsumers,
       .price        = &T::grid_price_per_kwh,
       .direction    = Direction::kCharge,
       .counterparty = Role::kExternalMarket},
      {.name         = "community sale",
       .kinds        = {EventKind::kGeneration},
       .roles        = {Role::kProsumer},
       .price        = &T::prosumer_sell_price,
       .direction    = Direction::kPay,
       .counterparty = Role::kFeeCollector},
      {.name         = "grid feed-in",
       .kinds        = {EventKind::kGridFeed},
       .roles        = {Role::kProsumer, Role::kOperator},
       .price        = &T::grid_feed_price,
       .direction    = Direction::kPay,
       .counterparty = Role::kExternalMarket},
      {.name         = "base fee",
       .kinds        = {EventKind::kBaseFee},
       .roles        = kAllMembers,
       .direction    = Direction::kCharge,
       .counterparty = Role::kFeeCollector},
  };
  return kRules;
}

template <>
const std::vector<PostingRule<MieterstromTerms>>& RulesFor<MieterstromTerms>() {
  using T = MieterstromTerms;
  static const std::vector<PostingRule<T>> kRules = {
      {.name             = "local supply",
       .kinds            = {EventKind::kConsumption},
       .source           = SourceMatch::kLocal,
       .roles            = kTenantConsumers,
       .price            = &T::tenant_price_per_kwh,
       .direction        = Direction::kCharge,
       .counterparty     = Role::kLandlord,
       .fee_mode         = FeeMode::kSplit,
       .fee_rate         = &T::operator_fee_rate,
       .fee_counterparty = Role::kOperator},
      {.name         = "grid supply",
       .kinds        = {EventKind::kConsumption},
       .source       = SourceMatch::kGrid,
       .roles        = kTenantConsumers,
       .price        = &T::grid_price_per_kwh,
       .direction    = Direction::kCharge,
       .counterparty = Role::kExternalMarket},
      {.name         = "base fee",
       .kinds        = {EventKind::kBaseFee},
       .roles        = kTenantConsumers,
       .price        = &T::base_fee_per_unit,
       .direction    = Direction::kCharge,
       .counterparty = Role::kLandlord},
      {.name         = "surplus feed-in",
       .kinds        = {EventKind::kGridFeed},
       .roles        = {Role::kLandlord, Role::kOperator, Role::kProsumer},
       .price        = &T::grid_compensation,
       .share        = &T::landlord_revenue_share,
       .direction    = Direction::kPay,
       .counterparty = Role::kExternalMarket},
  };
  return kRules;
}

template <>
const std::vector<PostingRule<VirtualPowerPlantTerms>>& RulesFor<VirtualPowerPlantTerms>() {
  using T = VirtualPowerPlantTerms;
  static const std::vector<PostingRule<T>> kRules = {
      {.name             = "market sale",
       .kinds            = {EventKind::kVppSale, EventKind::kGridFeed},
       .roles            = kFlexAssets,
       .price            = &T::market_price_per_kwh,
       .direction        = Direction::kPay,
       .counterparty     = Role::kExternalMarket,
       .fee_mode         = FeeMode::kSplit,
       .fee_rate         = &T::aggregator_fee_rate,
       .fee_counterparty = Role::kFeeCollector},
      {.name         = "battery discharge",
       .kinds        = {EventKind::kBatteryDischarge},
       .roles        = kFlexAssets,
       .price        = &T::market_price_per_kwh,
       .direction    = Direction::kPay,
       .counterparty = Role::kExternalMarket},
      {.name         = "battery charge",
       .kinds        = {EventKind::kBatteryCharge},
       .roles        = kFlexAssets,
       .price        = &T::market_price_per_kwh,
       .direction    = Direction::kCharge,
       .counterparty = Role::kExternalMarket},
      {.name         = "market purchase",
       .kinds        = {EventKind::kConsumption},
       .roles        = kMemberConsumers,
       .price        = &T::market_price_per_kwh,
       .direction    = Direction::kCharge,
       .counterparty = Role::kExternalMarket},
  };
  return kRules;
}

} // namespace settle::policy

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "internal/model/settlement.hpp"

namespace settle::audit {

/*
  Quantities of one participant inside a batch window, by bucket. Built only
  from the window's events, never from postings.
*/
struct UsageSummary {
  double local_supply_kwh      = 0.0;
  double grid_supply_kwh       = 0.0;
  double generated_kwh         = 0.0; // generation + production
  double fed_in_kwh            = 0.0; // grid_feed
  double base_fees_eur         = 0.0;
  double base_fee_units        = 0.0;
  double battery_charge_kwh    = 0.0;
  double battery_discharge_kwh = 0.0;
  double market_sale_kwh       = 0.0; // vpp_sale
  std::size_t events           = 0;
};

UsageSummary Summarize(const std::vector<model::UsageEvent>& events, model::ParticipantId participant_id);

// German display name of a role ("Mieter", "Vermieter", ...).
std::string_view RoleTitle(model::Role role);

// "Mieter A (Mieter): 10.0 kWh lokaler Strom. Zahlt 2.00 EUR."
std::string Explain(std::string_view name, model::Role role, model::Cents amount, const UsageSummary& usage);

} // namespace settle::audit

#include "internal/policy/policy_evaluator.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <string>

#include "internal/policy/policy_loader.hpp"
#include "internal/util/errors.hpp"

namespace {

using settle::aggregate::ClassifiedEvent;
using settle::aggregate::ParticipantDirectory;
using settle::model::EventKind;
using settle::model::Participant;
using settle::model::Role;
using settle::model::Unit;
using settle::policy::Policy;
using settle::policy::PolicyEvaluator;

constexpr settle::model::ParticipantId kTenant   = 1;
constexpr settle::model::ParticipantId kLandlord = 2;
constexpr settle::model::ParticipantId kOperator = 3;
constexpr settle::model::ParticipantId kProsumer = 4;

bool Near(double a, double b) {
  return std::fabs(a - b) < 1e-9;
}

ParticipantDirectory Directory() {
  return ParticipantDirectory({Participant{kTenant, "t1", "Mieter A", Role::kTenant}, Participant{kLandlord, "l1", "Vermieter", Role::kLandlord},
                               Participant{kOperator, "o1", "Betreiber", Role::kOperator},
                               Participant{kProsumer, "p1", "Prosumer", Role::kProsumer}});
}

Policy Load(const std::string& use_case, settle::policy::UnclassifiedSource treatment = settle::policy::UnclassifiedSource::kGrid) {
  settle::policy::RawPolicy raw;
  raw.use_case = use_case;
  auto policy  = settle::policy::LoadPolicy(raw);
  policy.unclassified_source = treatment;
  return policy;
}

ClassifiedEvent Event(settle::model::EventId id, settle::model::ParticipantId participant, Role role, EventKind kind, double quantity, Unit unit,
                      const std::string& source) {
  ClassifiedEvent event;
  event.event.id             = id;
  event.event.participant_id = participant;
  event.event.kind           = kind;
  event.event.quantity       = quantity;
  event.event.unit           = unit;
  event.event.source         = source;
  event.role                 = role;
  event.normalized_source    = settle::model::NormalizeSource(source);
  event.bucket               = settle::model::ClassifySource(event.normalized_source);
  return event;
}

void TestMieterstromLocalSupplySplitsOperatorFee() {
  auto       directory = Directory();
  const auto policy    = Load("mieterstrom");
  PolicyEvaluator evaluator(policy, directory);

  const auto result = evaluator.Evaluate(Event(10, kTenant, Role::kTenant, EventKind::kConsumption, 10.0, Unit::kKwh, "Local-PV"));
  assert(result.matched);
  assert(!result.unclassified);
  assert(result.postings.size() == 2);

  // 10 kWh * 0.18 = 1.80; operator keeps 15 %.
  assert(result.postings[0].debit_participant == kTenant);
  assert(result.postings[0].credit_participant == kLandlord);
  assert(Near(result.postings[0].amount, 1.53));
  assert(result.postings[1].debit_participant == kTenant);
  assert(result.postings[1].credit_participant == kOperator);
  assert(Near(result.postings[1].amount, 0.27));
  assert(result.postings[0].event_id == 10);
}

void TestGridSupplyCreatesProvisionalMarket() {
  auto       directory = Directory();
  const auto policy    = Load("mieterstrom");
  PolicyEvaluator evaluator(policy, directory);

  const auto result = evaluator.Evaluate(Event(11, kTenant, Role::kTenant, EventKind::kConsumption, 5.0, Unit::kKwh, "grid"));
  assert(result.matched);
  assert(result.postings.size() == 1);
  assert(result.postings[0].debit_participant == kTenant);
  assert(ParticipantDirectory::IsProvisional(result.postings[0].credit_participant));
  assert(Near(result.postings[0].amount, 1.6));

  assert(directory.Provisional().size() == 1);
  assert(directory.Provisional()[0].role == Role::kExternalMarket);
  assert(directory.Provisional()[0].external_id == "external-market");

  // A second event reuses the same provisional counterparty.
  (void)evaluator.Evaluate(Event(12, kTenant, Role::kTenant, EventKind::kConsumption, 1.0, Unit::kKwh, "utility"));
  assert(directory.Provisional().size() == 1);
}

void TestUnclassifiedSourceTreatments() {
  const auto event = Event(13, kTenant, Role::kTenant, EventKind::kConsumption, 10.0, Unit::kKwh, "mystery");

  {
    auto       directory = Directory();
    const auto policy    = Load("mieterstrom", settle::policy::UnclassifiedSource::kGrid);
    PolicyEvaluator evaluator(policy, directory);
    const auto result = evaluator.Evaluate(event);
    assert(result.unclassified);
    assert(result.matched);
    assert(Near(result.postings.at(0).amount, 3.2));
  }
  {
    auto       directory = Directory();
    const auto policy    = Load("mieterstrom", settle::policy::UnclassifiedSource::kZero);
    PolicyEvaluator evaluator(policy, directory);
    const auto result = evaluator.Evaluate(event);
    assert(result.unclassified);
    assert(!result.matched);
    assert(result.postings.empty());
  }
  {
    auto       directory = Directory();
    const auto policy    = Load("mieterstrom", settle::policy::UnclassifiedSource::kReject);
    PolicyEvaluator evaluator(policy, directory);
    bool threw = false;
    try {
      (void)evaluator.Evaluate(event);
    } catch (const settle::util::ValidationError&) {
      threw = true;
    }
    assert(threw);
  }
}

void TestSourceIsIgnoredWhereNoRuleDependsOnIt() {
  auto       directory = Directory();
  const auto policy    = Load("energy_community", settle::policy::UnclassifiedSource::kReject);
  PolicyEvaluator evaluator(policy, directory);

  // Generation is priced the same whatever its source.
  const auto result = evaluator.Evaluate(Event(14, kProsumer, Role::kProsumer, EventKind::kGeneration, 10.0, Unit::kKwh, "rooftop"));
  assert(result.matched);
  assert(!result.unclassified);
  assert(result.postings.size() == 1);
  assert(result.postings[0].credit_participant == kProsumer);
  assert(Near(result.postings[0].amount, 1.5));
}

void TestExplicitPriceWinsEvenWhenZero() {
  auto       directory = Directory();
  const auto policy    = Load("mieterstrom");
  PolicyEvaluator evaluator(policy, directory);

  auto priced                  = Event(15, kTenant, Role::kTenant, EventKind::kConsumption, 10.0, Unit::kKwh, "pv");
  priced.event.price_per_unit  = 0.25;
  auto result                  = evaluator.Evaluate(priced);
  assert(Near(result.postings[0].amount + result.postings[1].amount, 2.5));

  auto free                 = Event(16, kTenant, Role::kTenant, EventKind::kConsumption, 10.0, Unit::kKwh, "pv");
  free.event.price_per_unit = 0.0;
  result                    = evaluator.Evaluate(free);
  assert(result.matched);
  assert(result.postings.empty());
}

void TestEurEventsAreTakenAtFaceValue() {
  auto       directory = Directory();
  const auto policy    = Load("energy_community");
  PolicyEvaluator evaluator(policy, directory);

  const auto result = evaluator.Evaluate(Event(17, kTenant, Role::kTenant, EventKind::kBaseFee, 4.5, Unit::kEur, ""));
  assert(result.matched);
  assert(result.postings.size() == 1);
  assert(Near(result.postings[0].amount, 4.5));
  assert(directory.Provisional().at(0).role == Role::kFeeCollector);
}

void TestUnpricedEventIsNotMatched() {
  auto       directory = Directory();
  const auto policy    = Load("mieterstrom");
  PolicyEvaluator evaluator(policy, directory);

  const auto result = evaluator.Evaluate(Event(18, kProsumer, Role::kProsumer, EventKind::kBatteryCharge, 3.0, Unit::kKwh, "battery"));
  assert(!result.matched);
  assert(result.postings.empty());
}

void TestMissingRequiredCounterpartyIsRejected() {
  ParticipantDirectory directory({Participant{kTenant, "t1", "Mieter A", Role::kTenant}});
  const auto           policy = Load("mieterstrom");
  PolicyEvaluator      evaluator(policy, directory);

  bool threw = false;
  try {
    (void)evaluator.Evaluate(Event(19, kTenant, Role::kTenant, EventKind::kConsumption, 1.0, Unit::kKwh, "pv"));
  } catch (const settle::util::ValidationError& e) {
    threw = std::string(e.what()).find("landlord") != std::string::npos;
  }
  assert(threw && "Landlord is not synthetic and must exist.");
}

void TestVirtualPowerPlantSaleCarvesAggregatorFee() {
  auto       directory = Directory();
  const auto policy    = Load("virtual_power_plant");
  PolicyEvaluator evaluator(policy, directory);

  const auto result = evaluator.Evaluate(Event(20, kProsumer, Role::kProsumer, EventKind::kVppSale, 100.0, Unit::kKwh, ""));
  assert(result.postings.size() == 2);
  // Market pays the asset 95 % and the aggregator 5 % of 10.00 EUR.
  assert(result.postings[0].credit_participant == kProsumer);
  assert(Near(result.postings[0].amount, 9.5));
  assert(result.postings[1].debit_participant == result.postings[0].debit_participant);
  assert(Near(result.postings[1].amount, 0.5));
}

} // namespace

int main() {
  TestMieterstromLocalSupplySplitsOperatorFee();
  TestGridSupplyCreatesProvisionalMarket();
  TestUnclassifiedSourceTreatments();
  TestSourceIsIgnoredWhereNoRuleDependsOnIt();
  TestExplicitPriceWinsEvenWhenZero();
  TestEurEventsAreTakenAtFaceValue();
  TestUnpricedEventIsNotMatched();
  TestMissingRequiredCounterpartyIsRejected();
  TestVirtualPowerPlantSaleCarvesAggregatorFee();

  std::cout << "settle_unit_policy_evaluator: pass\n";
  return 0;
}

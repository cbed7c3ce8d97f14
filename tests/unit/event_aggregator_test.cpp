#include "internal/aggregate/event_aggregator.hpp"

#include <cassert>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

#include "internal/model/participant.hpp"
#include "internal/model/usage_event.hpp"
#include "internal/util/errors.hpp"

namespace {

using settle::aggregate::EventAggregator;
using settle::aggregate::ParticipantDirectory;
using settle::model::EventKind;
using settle::model::Participant;
using settle::model::Role;
using settle::model::SourceBucket;
using settle::model::TimeWindow;
using settle::model::Unit;
using settle::model::UsageEvent;
using settle::util::FromUnixMillis;

constexpr std::int64_t kStartMs = 1'714'521'600'000; // 2024-05-01T00:00:00Z
constexpr std::int64_t kHourMs  = 3'600'000;

TimeWindow Window() {
  return TimeWindow{FromUnixMillis(kStartMs), FromUnixMillis(kStartMs + 24 * kHourMs)};
}

ParticipantDirectory Directory() {
  return ParticipantDirectory({Participant{1, "t1", "Mieter A", Role::kTenant}, Participant{2, "l1", "Vermieter", Role::kLandlord}});
}

UsageEvent Event(settle::model::EventId id, settle::model::ParticipantId participant, std::int64_t offset_ms, double quantity,
                 const std::string& source, EventKind kind = EventKind::kConsumption) {
  UsageEvent event;
  event.id             = id;
  event.participant_id = participant;
  event.kind           = kind;
  event.quantity       = quantity;
  event.unit           = Unit::kKwh;
  event.timestamp      = FromUnixMillis(kStartMs + offset_ms);
  event.source         = source;
  return event;
}

template <typename Fn>
bool RejectsWithValidationError(Fn&& fn) {
  try {
    fn();
  } catch (const settle::util::ValidationError&) {
    return true;
  }
  return false;
}

void TestEventsAreOrderedByTimestampThenId() {
  const auto      directory = Directory();
  EventAggregator aggregator(directory, Window());

  const auto result = aggregator.Aggregate({Event(5, 1, 2 * kHourMs, 1.0, "pv"), Event(3, 1, kHourMs, 1.0, "pv"), Event(2, 1, 2 * kHourMs, 1.0, "grid")});

  assert(result.events.size() == 3);
  assert(result.events[0].event.id == 3);
  assert(result.events[1].event.id == 2);
  assert(result.events[2].event.id == 5);
}

void TestWindowIsHalfOpen() {
  const auto      directory = Directory();
  EventAggregator aggregator(directory, Window());

  const auto result = aggregator.Aggregate({Event(1, 1, 0, 1.0, "pv"), Event(2, 1, 24 * kHourMs, 1.0, "pv"), Event(3, 1, -1, 1.0, "pv"),
                                            Event(4, 1, 24 * kHourMs - 1, 1.0, "pv")});

  assert(result.events.size() == 2);
  assert(result.events[0].event.id == 1);
  assert(result.events[1].event.id == 4);
  assert(result.excluded_outside_window == 2);
}

void TestUsageIsGroupedByKindSourceAndUnit() {
  const auto      directory = Directory();
  EventAggregator aggregator(directory, Window());

  const auto result = aggregator.Aggregate({Event(1, 1, 0, 4.0, "Local PV"), Event(2, 1, 1, 6.0, "local_pv"), Event(3, 1, 2, 2.5, "grid"),
                                            Event(4, 1, 3, 1.0, "mystery"), Event(5, 2, 4, 7.0, "", EventKind::kGridFeed)});

  const auto& tenant = result.usage.at(1);
  assert(tenant.event_count == 4);
  assert(tenant.Sum(EventKind::kConsumption, Unit::kKwh) == 13.5);
  assert(tenant.Sum(EventKind::kConsumption, Unit::kKwh, SourceBucket::kLocal) == 10.0);
  assert(tenant.Sum(EventKind::kConsumption, Unit::kKwh, SourceBucket::kGrid) == 2.5);
  assert(tenant.Sum(EventKind::kConsumption, Unit::kKwh, SourceBucket::kUnclassified) == 1.0);
  assert(tenant.Sum(EventKind::kConsumption, Unit::kEur) == 0.0);

  assert(result.usage.at(2).Sum(EventKind::kGridFeed, Unit::kKwh) == 7.0);
  assert(result.events[0].bucket == SourceBucket::kLocal);
  assert(result.events[0].role == Role::kTenant);
}

void TestInvalidEventsFailTheRun() {
  const auto      directory = Directory();
  EventAggregator aggregator(directory, Window());

  assert(RejectsWithValidationError([&] { (void)aggregator.Aggregate({Event(1, 99, 0, 1.0, "pv")}); }));
  assert(RejectsWithValidationError([&] { (void)aggregator.Aggregate({Event(1, 1, 0, -1.0, "pv")}); }));
  assert(RejectsWithValidationError([&] { (void)aggregator.Aggregate({Event(1, 1, 0, std::numeric_limits<double>::infinity(), "pv")}); }));

  auto unitless = Event(1, 1, 0, 1.0, "pv");
  unitless.unit = Unit::kUnspecified;
  assert(RejectsWithValidationError([&] { (void)aggregator.Aggregate({unitless}); }));

  auto priced           = Event(1, 1, 0, 1.0, "pv");
  priced.price_per_unit = -0.1;
  assert(RejectsWithValidationError([&] { (void)aggregator.Aggregate({priced}); }));
}

void TestEventsOutsideWindowAreNotValidated() {
  const auto      directory = Directory();
  EventAggregator aggregator(directory, Window());

  const auto result = aggregator.Aggregate({Event(1, 99, -kHourMs, -1.0, "pv")});
  assert(result.events.empty());
  assert(result.excluded_outside_window == 1);
}

void TestRoleAndKindNamesNormalizeLikeSources() {
  assert(settle::model::NormalizeSource("  Local-PV ") == "local_pv");
  assert(settle::model::ParseRole(" Commercial Tenant\t") == Role::kCommercialTenant);
  assert(settle::model::ParseRole("FEE-COLLECTOR") == Role::kFeeCollector);
  assert(settle::model::ParseRole(" landlord ") == Role::kLandlord);
  assert(!settle::model::ParseRole("land lord").has_value());
  assert(!settle::model::ParseRole("").has_value());
  assert(settle::model::ParseEventKind(" Grid-Feed ") == EventKind::kGridFeed);
}

} // namespace

int main() {
  TestEventsAreOrderedByTimestampThenId();
  TestWindowIsHalfOpen();
  TestUsageIsGroupedByKindSourceAndUnit();
  TestInvalidEventsFailTheRun();
  TestEventsOutsideWindowAreNotValidated();
  TestRoleAndKindNamesNormalizeLikeSources();

  std::cout << "settle_unit_event_aggregator: pass\n";
  return 0;
}

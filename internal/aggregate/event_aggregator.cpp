#include "event_aggregator.hpp"

#include <algorithm>
#include <cmath>

#include <spdlog/fmt/fmt.h>

#include "internal/util/errors.hpp"

namespace settle::aggregate {

namespace {

void Validate(const model::UsageEvent& event) {
  if (event.kind == model::EventKind::kUnspecified) {
    throw util::ValidationError(fmt::format("event {} has no kind", event.id));
  }
  if (event.unit == model::Unit::kUnspecified) {
    throw util::ValidationError(fmt::format("event {} has no unit", event.id));
  }
  if (!std::isfinite(event.quantity) || event.quantity < 0.0) {
    throw util::ValidationError(fmt::format("event {} has invalid quantity {}", event.id, event.quantity));
  }
  if (event.price_per_unit && (!std::isfinite(*event.price_per_unit) || *event.price_per_unit < 0.0)) {
    throw util::ValidationError(fmt::format("event {} has invalid price {}", event.id, *event.price_per_unit));
  }
}

} // namespace

double ParticipantUsage::Sum(model::EventKind kind, model::Unit unit, std::optional<model::SourceBucket> bucket) const {
  double total = 0.0;
  for (const auto& [key, value] : totals) {
    if (key.kind != kind || key.unit != unit) continue;
    if (bucket && model::ClassifySource(key.source) != *bucket) continue;
    total += value;
  }
  return total;
}

EventAggregator::EventAggregator(const ParticipantDirectory& directory, model::TimeWindow window)
    : directory_(directory), window_(window) {
}

Aggregation EventAggregator::Aggregate(std::vector<model::UsageEvent> events) const {
  Aggregation result;

  std::sort(events.begin(), events.end(), [](const model::UsageEvent& a, const model::UsageEvent& b) {
    if (a.timestamp != b.timestamp) return a.timestamp < b.timestamp;
    return a.id < b.id;
  });

  for (auto& event : events) {
    if (!window_.Contains(event.timestamp)) {
      ++result.excluded_outside_window;
      continue;
    }

    Validate(event);
    const auto* participant = directory_.Find(event.participant_id);
    if (!participant) {
      throw util::ValidationError(fmt::format("event {} references unknown participant {}", event.id, event.participant_id));
    }

    ClassifiedEvent classified;
    classified.role              = participant->role;
    classified.normalized_source = model::NormalizeSource(event.source);
    classified.bucket            = model::ClassifySource(classified.normalized_source);

    auto& usage          = result.usage[event.participant_id];
    usage.participant_id = event.participant_id;
    usage.totals[UsageKey{event.kind, classified.normalized_source, event.unit}] += event.quantity;
    ++usage.event_count;

    classified.event = std::move(event);
    result.events.push_back(std::move(classified));
  }

  return result;
}

} // namespace settle::aggregate

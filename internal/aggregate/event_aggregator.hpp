#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

#include "internal/aggregate/participant_directory.hpp"
#include "internal/model/settlement.hpp"
#include "internal/model/usage_event.hpp"

namespace settle::aggregate {

struct ClassifiedEvent {
  model::UsageEvent   event;
  model::Role         role = model::Role::kUnspecified;
  std::string         normalized_source;
  model::SourceBucket bucket = model::SourceBucket::kUnclassified;
};

struct UsageKey {
  model::EventKind kind = model::EventKind::kUnspecified;
  std::string      source;
  model::Unit      unit = model::Unit::kUnspecified;

  bool operator<(const UsageKey& other) const {
    return std::tie(kind, source, unit) < std::tie(other.kind, other.source, other.unit);
  }
};

struct ParticipantUsage {
  model::ParticipantId       participant_id = 0;
  std::map<UsageKey, double> totals;
  std::size_t                event_count = 0;

  // Sum over all sources of `kind` in `unit`, optionally limited to a bucket.
  double Sum(model::EventKind kind, model::Unit unit, std::optional<model::SourceBucket> bucket = std::nullopt) const;
};

struct Aggregation {
  std::vector<ClassifiedEvent>                     events; // (timestamp, id) order
  std::map<model::ParticipantId, ParticipantUsage> usage;
  std::size_t                                      excluded_outside_window = 0;
};

/*
  Groups ingested events of one window by participant.

  Validation is fail-fast: an unknown participant, an unspecified kind or
  unit, a negative or non-finite quantity or price throws
  util::ValidationError and aborts the whole run.
*/
class EventAggregator {
 public:
  EventAggregator(const ParticipantDirectory& directory, model::TimeWindow window);

  Aggregation Aggregate(std::vector<model::UsageEvent> events) const;

 private:
  const ParticipantDirectory& directory_;
  model::TimeWindow           window_;
};

} // namespace settle::aggregate

#pragma once

#include <cstdint>
#include <string>

#include "internal/model/money.hpp"
#include "internal/model/participant.hpp"
#include "internal/model/usage_event.hpp"
#include "internal/util/time.hpp"

namespace settle::model {

using BatchId  = std::int64_t;
using LineId   = std::int64_t;
using PolicyId = std::int64_t;

// Half-open [start, end).
struct TimeWindow {
  util::TimePoint start{};
  util::TimePoint end{};

  bool Contains(util::TimePoint t) const {
    return t >= start && t < end;
  }

  bool Overlaps(const TimeWindow& other) const {
    return start < other.end && other.start < end;
  }
};

// Running totals of one participant before netting. net = debit - credit.
struct Balance {
  double credit = 0.0;
  double debit  = 0.0;

  double Net() const {
    return debit - credit;
  }
};

// One side of a double-entry pair: `amount` moves from debit side to credit side.
struct Posting {
  ParticipantId debit_participant  = 0;
  ParticipantId credit_participant = 0;
  double        amount             = 0.0;
  EventId       event_id           = 0;
  std::string   rule;
};

struct Transfer {
  ParticipantId debtor_id   = 0;
  ParticipantId creditor_id = 0;
  Cents         amount      = 0;
};

struct SettlementBatch {
  BatchId         id = 0;
  std::string     use_case;
  TimeWindow      window;
  util::TimePoint created_at{};
  PolicyId        policy_id = 0;
};

struct SettlementLine {
  LineId        id             = 0;
  BatchId       batch_id       = 0;
  ParticipantId participant_id = 0;
  Cents         amount         = 0;
  std::string   description;
  std::string   proof_hash;
};

} // namespace settle::model

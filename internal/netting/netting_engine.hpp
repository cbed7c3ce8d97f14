#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <vector>

#include "internal/model/money.hpp"
#include "internal/model/settlement.hpp"

namespace settle::netting {

struct NettingOptions {
  model::RoundingMode rounding_mode = model::RoundingMode::kHalfUp;
  double              zero_epsilon  = 1e-9;
  // Minimum line magnitude in EUR per participant; unset means no threshold.
  std::function<double(model::ParticipantId)> min_payout;
};

struct Position {
  model::ParticipantId participant_id = 0;
  double               exact_net      = 0.0; // debit - credit, unrounded
  model::Cents         rounded        = 0;   // net after the single rounding step
  model::Cents         unmatched      = 0;   // left over after greedy matching
  model::Cents         final_amount   = 0;   // what the ledger records, 0 if suppressed
  bool                 suppressed     = false;
};

struct NettingStats {
  std::size_t transfer_count     = 0;
  double      gross_volume       = 0.0;
  double      net_volume         = 0.0;
  double      netting_efficiency = 0.0;
  double      rounding_residual  = 0.0;
  std::size_t suppressed_count   = 0;
  double      suppressed_volume  = 0.0;
  double      unmatched_volume   = 0.0;
};

struct NettingResult {
  std::map<model::ParticipantId, Position> positions;
  std::vector<model::Transfer>             transfers;
  NettingStats                             stats;

  model::Cents FinalTotal() const;
  model::Cents RoundedTotal() const;
  model::Cents SuppressedTotal() const;
};

/*
  Greedy bilateral netting.

  1. net = debit - credit per participant, rounded once to cents
  2. debtors net > eps, creditors net < -eps
  3. both sides sorted by descending magnitude, ties by ascending id
  4. largest debtor pays largest creditor min(remaining) until one side runs out
  5. leftovers are reported per participant as unmatched
  6. final amounts below the participant's minimum payout are suppressed

  Produces at most debtors + creditors - 1 transfers. Not a minimal-transfer
  solver.
*/
class NettingEngine {
 public:
  explicit NettingEngine(NettingOptions options);

  NettingResult Net(const std::map<model::ParticipantId, model::Balance>& balances) const;

 private:
  NettingOptions options_;
};

} // namespace settle::netting

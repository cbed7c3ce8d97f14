#include "netting_engine.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <utility>

namespace settle::netting {

namespace {

struct Side {
  model::ParticipantId id        = 0;
  model::Cents         remaining = 0; // magnitude
};

void SortSide(std::vector<Side>& side) {
  std::sort(side.begin(), side.end(), [](const Side& a, const Side& b) {
    if (a.remaining != b.remaining) return a.remaining > b.remaining;
    return a.id < b.id;
  });
}

} // namespace

model::Cents NettingResult::FinalTotal() const {
  model::Cents total = 0;
  for (const auto& [_, position] : positions) total += position.final_amount;
  return total;
}

model::Cents NettingResult::RoundedTotal() const {
  model::Cents total = 0;
  for (const auto& [_, position] : positions) total += position.rounded;
  return total;
}

model::Cents NettingResult::SuppressedTotal() const {
  model::Cents total = 0;
  for (const auto& [_, position] : positions) {
    if (position.suppressed) total += position.rounded;
  }
  return total;
}

NettingEngine::NettingEngine(NettingOptions options) : options_(std::move(options)) {
}

NettingResult NettingEngine::Net(const std::map<model::ParticipantId, model::Balance>& balances) const {
  NettingResult result;

  std::vector<Side> debtors;
  std::vector<Side> creditors;
  double            exact_total = 0.0;

  // ------------------------------------------------------------
  // 1-2: round once, partition
  // ------------------------------------------------------------
  for (const auto& [id, balance] : balances) {
    Position position;
    position.participant_id = id;
    position.exact_net      = balance.Net();
    result.stats.gross_volume += balance.credit + balance.debit;
    exact_total += position.exact_net;

    if (std::fabs(position.exact_net) > options_.zero_epsilon) {
      position.rounded = model::RoundToCents(position.exact_net, options_.rounding_mode);
    }
    if (position.rounded > 0) {
      debtors.push_back({id, position.rounded});
    } else if (position.rounded < 0) {
      creditors.push_back({id, -position.rounded});
    }
    result.positions[id] = position;
  }

  // ------------------------------------------------------------
  // 3-5: greedy matching
  // ------------------------------------------------------------
  SortSide(debtors);
  SortSide(creditors);

  std::size_t d = 0;
  std::size_t c = 0;
  while (d < debtors.size() && c < creditors.size()) {
    const auto amount = std::min(debtors[d].remaining, creditors[c].remaining);
    result.transfers.push_back(model::Transfer{debtors[d].id, creditors[c].id, amount});
    debtors[d].remaining -= amount;
    creditors[c].remaining -= amount;
    if (debtors[d].remaining == 0) ++d;
    if (creditors[c].remaining == 0) ++c;
  }
  for (; d < debtors.size(); ++d) {
    result.positions[debtors[d].id].unmatched = debtors[d].remaining;
  }
  for (; c < creditors.size(); ++c) {
    result.positions[creditors[c].id].unmatched = -creditors[c].remaining;
  }

  // ------------------------------------------------------------
  // 6: minimum payout
  // ------------------------------------------------------------
  model::Cents rounded_total = 0;
  model::Cents net_cents     = 0;
  model::Cents unmatched     = 0;
  model::Cents suppressed    = 0;
  for (auto& [id, position] : result.positions) {
    rounded_total += position.rounded;
    unmatched += std::abs(position.unmatched);
    if (position.rounded == 0) continue;

    const double threshold_eur = options_.min_payout ? options_.min_payout(id) : 0.0;
    const auto   threshold     = model::RoundToCents(threshold_eur, model::RoundingMode::kHalfUp);
    if (std::abs(position.rounded) < threshold) {
      position.suppressed = true;
      ++result.stats.suppressed_count;
      suppressed += std::abs(position.rounded);
      continue;
    }
    position.final_amount = position.rounded;
    net_cents += std::abs(position.final_amount);
  }

  result.stats.transfer_count     = result.transfers.size();
  result.stats.net_volume         = model::ToEur(net_cents);
  result.stats.suppressed_volume  = model::ToEur(suppressed);
  result.stats.unmatched_volume   = model::ToEur(unmatched);
  result.stats.rounding_residual  = model::ToEur(rounded_total) - exact_total;
  result.stats.netting_efficiency = result.stats.gross_volume > 0.0 ? 1.0 - result.stats.net_volume / result.stats.gross_volume : 0.0;
  return result;
}

} // namespace settle::netting

#include "internal/netting/netting_engine.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <cstdlib>
#include <map>
#include <random>

namespace {

using settle::model::Balance;
using settle::model::ParticipantId;
using settle::netting::NettingEngine;
using settle::netting::NettingOptions;

using Balances = std::map<ParticipantId, Balance>;

Balance Owes(double eur) {
  return Balance{0.0, eur};
}

Balance Owed(double eur) {
  return Balance{eur, 0.0};
}

void TestTwoDebtorsOneCreditor() {
  NettingEngine engine{NettingOptions{}};
  const auto    result = engine.Net({{1, Owes(2.0)}, {2, Owes(0.8)}, {3, Owed(2.8)}});

  assert(result.positions.at(1).final_amount == 200);
  assert(result.positions.at(2).final_amount == 80);
  assert(result.positions.at(3).final_amount == -280);
  assert(result.FinalTotal() == 0);

  assert(result.transfers.size() == 2);
  assert(result.transfers[0].debtor_id == 1);
  assert(result.transfers[0].creditor_id == 3);
  assert(result.transfers[0].amount == 200);
  assert(result.transfers[1].debtor_id == 2);
  assert(result.transfers[1].creditor_id == 3);
  assert(result.transfers[1].amount == 80);
}

void TestTransferCountIsBounded() {
  NettingEngine engine{NettingOptions{}};
  const auto    result = engine.Net({{1, Owes(3.0)}, {2, Owes(3.0)}, {3, Owes(1.0)}, {4, Owed(4.0)}, {5, Owed(2.0)}, {6, Owed(1.0)}});

  assert(result.transfers.size() <= 5);
  assert(result.FinalTotal() == 0);
  // Equal debtors: the lower id pays first.
  assert(result.transfers[0].debtor_id == 1);
  assert(result.transfers[0].creditor_id == 4);

  settle::model::Cents paid = 0;
  for (const auto& transfer : result.transfers) {
    assert(transfer.amount > 0);
    paid += transfer.amount;
  }
  assert(paid == 700);
}

void TestOwnOffsettingFlowsNet() {
  NettingEngine engine{NettingOptions{}};
  const auto    result = engine.Net({{1, Balance{8.0, 10.0}}, {2, Owed(2.0)}});

  assert(result.positions.at(1).rounded == 200);
  assert(result.positions.at(2).rounded == -200);
  assert(std::fabs(result.stats.gross_volume - 20.0) < 1e-9);
  assert(std::fabs(result.stats.net_volume - 4.0) < 1e-9);
  assert(std::fabs(result.stats.netting_efficiency - 0.8) < 1e-9);
}

void TestEpsilonBalancesAreTreatedAsZero() {
  NettingEngine engine{NettingOptions{}};
  const auto    result = engine.Net({{1, Balance{1.0, 1.0 + 1e-12}}});

  assert(result.positions.at(1).rounded == 0);
  assert(result.positions.at(1).final_amount == 0);
  assert(result.transfers.empty());
}

void TestUnmatchedRemainderIsReported() {
  // Synthetic rounding imbalance: one cent has no counterpart.
  NettingEngine engine{NettingOptions{}};
  const auto    result = engine.Net({{1, Owes(1.005)}, {2, Owed(1.0)}});

  assert(result.positions.at(1).rounded == 101);
  assert(result.positions.at(1).unmatched == 1);
  assert(result.positions.at(2).unmatched == 0);
  assert(std::fabs(result.stats.unmatched_volume - 0.01) < 1e-9);
  assert(result.FinalTotal() == 1);
}

void TestMinimumPayoutSuppressesSmallLines() {
  NettingOptions options;
  options.min_payout = [](ParticipantId) { return 5.0; };
  NettingEngine engine(options);

  const auto result = engine.Net({{1, Owes(4.99)}, {2, Owes(5.01)}, {3, Owed(10.0)}});

  assert(result.positions.at(1).suppressed);
  assert(result.positions.at(1).final_amount == 0);
  assert(!result.positions.at(2).suppressed);
  assert(result.positions.at(2).final_amount == 501);
  assert(result.positions.at(3).final_amount == -1000);

  assert(result.stats.suppressed_count == 1);
  assert(std::fabs(result.stats.suppressed_volume - 4.99) < 1e-9);
  assert(result.SuppressedTotal() == 499);
  assert(result.FinalTotal() == result.RoundedTotal() - result.SuppressedTotal());

  // Transfers are matched before the threshold applies.
  assert(result.transfers.size() == 2);
}

void TestThresholdIsPerParticipant() {
  NettingOptions options;
  options.min_payout = [](ParticipantId id) { return id == 3 ? 20.0 : 0.0; };
  NettingEngine engine(options);

  const auto result = engine.Net({{1, Owes(10.0)}, {3, Owed(10.0)}});
  assert(!result.positions.at(1).suppressed);
  assert(result.positions.at(3).suppressed);
  assert(result.FinalTotal() == 1000);
}

void TestRoundingModeAppliesOnce() {
  NettingOptions half_even;
  half_even.rounding_mode = settle::model::RoundingMode::kHalfEven;

  const Balances balances{{1, Owes(0.125)}, {2, Owed(0.125)}};

  const auto up   = NettingEngine{NettingOptions{}}.Net(balances);
  const auto even = NettingEngine{half_even}.Net(balances);

  assert(up.positions.at(1).rounded == 13);
  assert(up.positions.at(2).rounded == -13);
  assert(even.positions.at(1).rounded == 12);
  assert(even.positions.at(2).rounded == -12);
  assert(std::fabs(up.stats.rounding_residual) < 1e-9);
}

// Seeded sweep over open and closed participant sets.
void TestNettingNeverIncreasesExposure() {
  std::mt19937                           rng(20240501);
  std::uniform_real_distribution<double> amount(0.0, 250.0);
  std::uniform_int_distribution<int>     size(1, 12);

  NettingEngine engine{NettingOptions{}};
  for (int run = 0; run < 200; ++run) {
    Balances balances;
    double   gross     = 0.0;
    double   exact_net = 0.0;
    const int count    = size(rng);
    for (int i = 1; i <= count; ++i) {
      const Balance balance{amount(rng), run % 3 == 0 ? 0.0 : amount(rng)};
      gross += balance.credit + balance.debit;
      exact_net += balance.debit - balance.credit;
      balances.emplace(i, balance);
    }

    const auto result = engine.Net(balances);

    settle::model::Cents exposure = 0;
    for (const auto& [id, position] : result.positions) {
      exposure += std::llabs(position.final_amount);
    }
    // Each participant is rounded once, by at most half a cent.
    assert(static_cast<double>(exposure) <= gross * 100.0 + 0.5 * count + 1e-6);
    assert(std::fabs(static_cast<double>(result.RoundedTotal()) - exact_net * 100.0) <= 0.5 * count + 1e-6);
    assert(result.FinalTotal() == result.RoundedTotal() - result.SuppressedTotal());

    settle::model::Cents transferred = 0;
    for (const auto& transfer : result.transfers) {
      transferred += transfer.amount;
    }
    assert(2 * transferred <= exposure);
  }
}

} // namespace

int main() {
  TestTwoDebtorsOneCreditor();
  TestTransferCountIsBounded();
  TestOwnOffsettingFlowsNet();
  TestEpsilonBalancesAreTreatedAsZero();
  TestUnmatchedRemainderIsReported();
  TestMinimumPayoutSuppressesSmallLines();
  TestThresholdIsPerParticipant();
  TestRoundingModeAppliesOnce();
  TestNettingNeverIncreasesExposure();

  std::cout << "settle_unit_netting_engine: pass\n";
  return 0;
}

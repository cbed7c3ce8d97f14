#include "internal/ledger/proof_hash.hpp"

#include <cassert>
#include <iostream>
#include <string>

namespace {

using settle::ledger::CanonicalLinePayload;
using settle::ledger::ComputeProofHash;
using settle::ledger::ProofFields;
using settle::ledger::VerifyProofHash;

ProofFields SampleLine() {
  ProofFields fields;
  fields.batch_id       = 1;
  fields.participant_id = 2;
  fields.amount         = 280;
  fields.description    = "mieterstrom settlement: pays 2.80 EUR";
  return fields;
}

void TestSha256KnownVector() {
  assert(settle::ledger::Sha256Hex("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  assert(settle::ledger::Sha256Hex("") == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

void TestCanonicalPayloadLayout() {
  assert(CanonicalLinePayload(SampleLine()) ==
         R"({"amount_eur":2.8,"batch_id":1,"description":"mieterstrom settlement: pays 2.80 EUR","participant_id":2})");

  auto negative   = SampleLine();
  negative.amount = -5;
  assert(CanonicalLinePayload(negative).find(R"("amount_eur":-0.05,)") != std::string::npos);
}

void TestHashIsDeterministicAndLowerHex() {
  const auto first  = ComputeProofHash(SampleLine());
  const auto second = ComputeProofHash(SampleLine());
  assert(first == second);
  assert(first.size() == 64);
  for (char c : first) {
    assert((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'));
  }
}

void TestAnyFieldChangeBreaksVerification() {
  const auto stored = ComputeProofHash(SampleLine());
  assert(VerifyProofHash(SampleLine(), stored));

  auto amount = SampleLine();
  amount.amount += 1;
  assert(!VerifyProofHash(amount, stored));

  auto batch = SampleLine();
  batch.batch_id = 2;
  assert(!VerifyProofHash(batch, stored));

  auto participant = SampleLine();
  participant.participant_id = 3;
  assert(!VerifyProofHash(participant, stored));

  auto description = SampleLine();
  description.description += " ";
  assert(!VerifyProofHash(description, stored));
}

void TestDescribeLine() {
  assert(settle::ledger::DescribeLine("mieterstrom", 280) == "mieterstrom settlement: pays 2.80 EUR");
  assert(settle::ledger::DescribeLine("energy_community", -153) == "energy_community settlement: receives 1.53 EUR");
}

} // namespace

int main() {
  TestSha256KnownVector();
  TestCanonicalPayloadLayout();
  TestHashIsDeterministicAndLowerHex();
  TestAnyFieldChangeBreaksVerification();
  TestDescribeLine();

  std::cout << "settle_unit_proof_hash: pass\n";
  return 0;
}

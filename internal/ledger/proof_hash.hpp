#pragma once

#include <string>
#include <string_view>

#include "internal/model/settlement.hpp"

namespace settle::ledger {

/*
  Proof hash of a settlement line.

  Pure function of (batch_id, participant_id, amount, description). The
  canonical payload is

    {"amount_eur":<amount>,"batch_id":<id>,"description":"...","participant_id":<id>}

  with the amount as the double nearest to cents / 100, which prints as the
  decimal itself ("2.8", "-0.05", "12.0"). The digest is
  SHA-256 over the UTF-8 bytes, lower-case hex.
*/

struct ProofFields {
  model::BatchId       batch_id       = 0;
  model::ParticipantId participant_id = 0;
  model::Cents         amount         = 0;
  std::string          description;
};

ProofFields FieldsOf(const model::SettlementLine& line);

std::string CanonicalLinePayload(const ProofFields& fields);
std::string ComputeProofHash(const ProofFields& fields);
bool        VerifyProofHash(const ProofFields& fields, std::string_view stored_hash);

std::string Sha256Hex(std::string_view data);

// "<use_case> settlement: pays 2.80 EUR" / "... receives 2.80 EUR"
std::string DescribeLine(std::string_view use_case, model::Cents amount);

} // namespace settle::ledger

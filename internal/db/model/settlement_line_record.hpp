#pragma once

#include <cstdint>
#include <string>

namespace settle::db::model {

struct SettlementLineRecord {
  std::int64_t id             = 0;
  std::int64_t batch_id       = 0;
  std::int64_t participant_id = 0;
  std::int64_t amount_cents   = 0; // debit - credit: positive owes, negative is owed
  std::string  description;
  std::string  proof_hash;
};

} // namespace settle::db::model

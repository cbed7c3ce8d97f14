#pragma once

#include <map>
#include <vector>

#include "internal/model/participant.hpp"

namespace settle::aggregate {

/*
  Participants known to one settlement run.

  Synthetic counterparties (external market, fee collector) that are not yet
  persisted get a provisional entry with a negative id the first time a rule
  asks for them. The engine materialises those before writing a batch.
*/
class ParticipantDirectory {
 public:
  ParticipantDirectory() = default;
  explicit ParticipantDirectory(const std::vector<model::Participant>& participants);

  const model::Participant* Find(model::ParticipantId id) const;

  // Lowest id holding the role, or nullptr.
  const model::Participant* FirstWithRole(model::Role role) const;

  // Counterparty for a posting rule. Synthetic roles never yield nullptr.
  const model::Participant* ResolveCounterparty(model::Role role);

  const std::vector<model::Participant>& Provisional() const {
    return provisional_;
  }

  static bool IsProvisional(model::ParticipantId id) {
    return id < 0;
  }

 private:
  std::map<model::ParticipantId, model::Participant> by_id_;
  std::vector<model::Participant>                    provisional_;
};

} // namespace settle::aggregate

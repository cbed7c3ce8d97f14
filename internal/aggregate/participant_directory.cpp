#include "participant_directory.hpp"

#include <string>

namespace settle::aggregate {

ParticipantDirectory::ParticipantDirectory(const std::vector<model::Participant>& participants) {
  for (const auto& participant : participants) {
    by_id_[participant.id] = participant;
  }
}

const model::Participant* ParticipantDirectory::Find(model::ParticipantId id) const {
  auto it = by_id_.find(id);
  return it == by_id_.end() ? nullptr : &it->second;
}

const model::Participant* ParticipantDirectory::FirstWithRole(model::Role role) const {
  // Provisional ids are negative so persisted participants are scanned first.
  const model::Participant* provisional = nullptr;
  for (const auto& [id, participant] : by_id_) {
    if (participant.role != role) continue;
    if (IsProvisional(id)) {
      provisional = &participant;
      continue;
    }
    return &participant;
  }
  return provisional;
}

const model::Participant* ParticipantDirectory::ResolveCounterparty(model::Role role) {
  if (const auto* existing = FirstWithRole(role)) {
    return existing;
  }
  if (!model::IsSynthetic(role)) {
    return nullptr;
  }

  model::Participant synthetic;
  synthetic.id          = -static_cast<model::ParticipantId>(provisional_.size() + 1);
  synthetic.external_id = std::string(model::SyntheticExternalId(role));
  synthetic.name        = synthetic.external_id;
  synthetic.role        = role;
  provisional_.push_back(synthetic);

  auto [it, inserted] = by_id_.emplace(synthetic.id, synthetic);
  return &it->second;
}

} // namespace settle::aggregate

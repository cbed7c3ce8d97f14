#pragma once

#include <vector>

#include "internal/aggregate/event_aggregator.hpp"
#include "internal/aggregate/participant_directory.hpp"
#include "internal/model/settlement.hpp"
#include "internal/policy/policy.hpp"

namespace settle::policy {

struct Evaluation {
  std::vector<model::Posting> postings; // zero, one or two
  bool                        matched      = false;
  bool                        unclassified = false;
};

/*
  Maps one classified event to double-entry postings under a policy.

  Pure apart from provisional counterparties registered in the directory.
  Throws util::ValidationError when a required counterparty is missing, an
  event needs a price nobody supplies, or an unclassified source is rejected.
*/
class PolicyEvaluator {
 public:
  PolicyEvaluator(const Policy& policy, aggregate::ParticipantDirectory& directory);

  Evaluation Evaluate(const aggregate::ClassifiedEvent& event);

 private:
  template <typename T>
  Evaluation EvaluateWith(const T& terms, const aggregate::ClassifiedEvent& event);

  const model::Participant& RequireCounterparty(model::Role role, std::string_view rule, const aggregate::ClassifiedEvent& event);

  const Policy&                    policy_;
  aggregate::ParticipantDirectory& directory_;
};

} // namespace settle::policy

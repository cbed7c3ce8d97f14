#include "policy_evaluator.hpp"

#include <algorithm>
#include <string>

#include <spdlog/fmt/fmt.h>

#include "internal/policy/rule_table.hpp"
#include "internal/util/errors.hpp"

namespace settle::policy {

namespace {

bool SourceMatches(SourceMatch match, model::SourceBucket bucket) {
  switch (match) {
    case SourceMatch::kLocal:
      return bucket == model::SourceBucket::kLocal;
    case SourceMatch::kGrid:
      return bucket == model::SourceBucket::kGrid;
    case SourceMatch::kAny:
    default:
      return true;
  }
}

void Emit(std::vector<model::Posting>& out, model::ParticipantId debit, model::ParticipantId credit, double amount, const aggregate::ClassifiedEvent& event,
          std::string_view rule) {
  if (amount == 0.0 || debit == credit) {
    return;
  }
  out.push_back(model::Posting{debit, credit, amount, event.event.id, std::string(rule)});
}

} // namespace

PolicyEvaluator::PolicyEvaluator(const Policy& policy, aggregate::ParticipantDirectory& directory) : policy_(policy), directory_(directory) {
}

Evaluation PolicyEvaluator::Evaluate(const aggregate::ClassifiedEvent& event) {
  return std::visit([&](const auto& terms) { return EvaluateWith(terms, event); }, policy_.terms);
}

const model::Participant& PolicyEvaluator::RequireCounterparty(model::Role role, std::string_view rule, const aggregate::ClassifiedEvent& event) {
  const auto* counterparty = directory_.ResolveCounterparty(role);
  if (!counterparty) {
    throw util::ValidationError(fmt::format("rule '{}' needs a {} counterparty for event {} of participant {}, but none exists", rule,
                                            model::ToString(role), event.event.id, event.event.participant_id));
  }
  return *counterparty;
}

template <typename T>
Evaluation PolicyEvaluator::EvaluateWith(const T& terms, const aggregate::ClassifiedEvent& event) {
  const auto& rules = RulesFor<T>();
  const auto& e     = event.event;

  Evaluation result;
  auto       bucket = event.bucket;

  if (bucket == model::SourceBucket::kUnclassified) {
    const bool source_sensitive = std::any_of(rules.begin(), rules.end(), [&](const PostingRule<T>& rule) {
      return rule.source != SourceMatch::kAny && rule.Covers(e.kind, event.role);
    });
    if (source_sensitive) {
      result.unclassified = true;
      switch (policy_.unclassified_source) {
        case UnclassifiedSource::kReject:
          throw util::ValidationError(fmt::format("event {} of participant {} has unclassified source '{}'", e.id, e.participant_id, e.source));
        case UnclassifiedSource::kZero:
          return result;
        case UnclassifiedSource::kGrid:
        default:
          bucket = model::SourceBucket::kGrid;
          break;
      }
    }
  }

  for (const auto& rule : rules) {
    if (!rule.Covers(e.kind, event.role) || !SourceMatches(rule.source, bucket)) {
      continue;
    }

    double amount = e.quantity;
    if (e.unit != model::Unit::kEur) {
      double price = 0.0;
      if (e.price_per_unit) {
        price = *e.price_per_unit;
      } else if (rule.price) {
        price = terms.*rule.price;
      } else {
        throw util::ValidationError(
            fmt::format("rule '{}' has no default price and event {} carries none (unit {})", rule.name, e.id, model::ToString(e.unit)));
      }
      amount = e.quantity * price;
    }
    if (rule.share) {
      amount *= terms.*rule.share;
    }

    const auto& counterparty = RequireCounterparty(rule.counterparty, rule.name, event);
    const auto  participant  = e.participant_id;

    double primary = amount;
    double fee     = 0.0;
    if (rule.fee_mode != FeeMode::kNone && rule.fee_rate) {
      fee = amount * (terms.*rule.fee_rate);
      if (rule.fee_mode == FeeMode::kSplit) {
        primary = amount - fee;
      }
    }

    if (rule.direction == Direction::kCharge) {
      Emit(result.postings, participant, counterparty.id, primary, event, rule.name);
    } else {
      Emit(result.postings, counterparty.id, participant, primary, event, rule.name);
    }

    if (fee != 0.0) {
      const auto& fee_counterparty = RequireCounterparty(rule.fee_counterparty, rule.name, event);
      model::ParticipantId payer = participant;
      if (rule.fee_mode == FeeMode::kSplit && rule.direction == Direction::kPay) {
        payer = counterparty.id;
      }
      Emit(result.postings, payer, fee_counterparty.id, fee, event, rule.name);
    }

    result.matched = true;
    return result;
  }

  return result;
}

} // namespace settle::policy

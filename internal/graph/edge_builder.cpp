#include "internal/graph/edge_builder.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <set>
#include <utility>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"

namespace collab::graph {

using model::CollaborationType;
using model::PersonId;
using model::RoleKind;

namespace {

std::string Lower(std::string_view value) {
  std::string out(value);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

// Accumulates candidates, keeping the highest precedence type per pair.
class CandidateSet {
 public:
  explicit CandidateSet(BuildReport& report) : report_(report) {
  }

  void Add(CollaborationType type, PersonId a, RoleKind a_role, PersonId b, RoleKind b_role) {
    if (a == b) {
      ++report_.self_pairs_rejected;
      return;
    }

    const auto pair     = model::PersonPair::Canonical(a, b);
    const bool a_is_low = pair.low == a;

    auto [it, inserted] = by_pair_.try_emplace(pair);
    auto& candidate     = it->second;
    if (!inserted && !model::TakesPrecedence(type, candidate.type)) {
      return;
    }
    candidate.pair      = pair;
    candidate.type      = type;
    candidate.low_role  = a_is_low ? a_role : b_role;
    candidate.high_role = a_is_low ? b_role : a_role;
  }

  std::vector<EdgeCandidate> Take() {
    std::vector<EdgeCandidate> out;
    out.reserve(by_pair_.size());
    for (auto& [_, candidate] : by_pair_) {
      out.push_back(candidate);
    }
    return out;
  }

 private:
  BuildReport&                               report_;
  std::map<model::PersonPair, EdgeCandidate> by_pair_;
};

void AddAllPairs(CandidateSet& set, CollaborationType type, RoleKind role, const std::vector<PersonId>& people) {
  for (std::size_t i = 0; i < people.size(); ++i) {
    for (std::size_t j = i + 1; j < people.size(); ++j) {
      set.Add(type, people[i], role, people[j], role);
    }
  }
}

void AddCrossPairs(CandidateSet& set, CollaborationType type, RoleKind left_role, const std::vector<PersonId>& left, RoleKind right_role,
                   const std::vector<PersonId>& right) {
  for (const auto a : left) {
    for (const auto b : right) {
      set.Add(type, a, left_role, b, right_role);
    }
  }
}

void SkipCredit(BuildReport& report, model::WorkId work_id, std::string_view reason, const db::model::CreditRecord& credit) {
  ++report.skipped_credits;
  COLLAB_LOG_WARN("skipping malformed credit", {observability::IntField("work_id", work_id), observability::StringField("reason", reason),
                                                observability::IntField("person_id", credit.person_id.value_or(0))});
}

} // namespace

EdgePolicy::EdgePolicy(int performer_performer_cap, int performer_director_cap, const std::vector<std::string>& key_crew_roles)
    : performer_performer_cap_(performer_performer_cap), performer_director_cap_(performer_director_cap) {
  for (const auto& role : key_crew_roles) {
    key_crew_roles_.insert(Lower(role));
  }
}

EdgePolicy EdgePolicy::FromConfig(const collab::runtime::config::EdgePolicyConfig& config) {
  return EdgePolicy(static_cast<int>(config.performer_performer_cap()), static_cast<int>(config.performer_director_cap()),
                    {config.key_crew_roles().begin(), config.key_crew_roles().end()});
}

bool EdgePolicy::IsKeyCrew(std::string_view role_name) const {
  return key_crew_roles_.contains(Lower(role_name));
}

EdgeBuilder::EdgeBuilder(EdgePolicy policy) : policy_(std::move(policy)) {
}

BuildOutput EdgeBuilder::Build(model::WorkId work_id, const std::vector<db::model::CreditRecord>& credits) const {
  BuildOutput output;
  auto&       report = output.report;

  // lowest ordinal per performer
  std::map<PersonId, std::int32_t> performers;
  std::set<PersonId>               directors;
  std::set<PersonId>               key_crew;

  for (const auto& credit : credits) {
    if (!credit.person_id) {
      SkipCredit(report, work_id, "missing person id", credit);
      continue;
    }
    const auto person = *credit.person_id;

    switch (credit.role_kind) {
      case RoleKind::kPerformer: {
        if (!credit.billing_ordinal) {
          SkipCredit(report, work_id, "performer without billing ordinal", credit);
          break;
        }
        auto [it, inserted] = performers.try_emplace(person, *credit.billing_ordinal);
        if (!inserted) it->second = std::min(it->second, *credit.billing_ordinal);
        break;
      }
      case RoleKind::kDirector:
        directors.insert(person);
        break;
      case RoleKind::kCrew:
        if (credit.role_name.empty()) {
          SkipCredit(report, work_id, "crew credit without role name", credit);
          break;
        }
        if (policy_.IsKeyCrew(credit.role_name)) key_crew.insert(person);
        break;
      case RoleKind::kUnspecified:
      default:
        SkipCredit(report, work_id, "unknown role kind", credit);
        break;
    }
  }

  std::vector<PersonId> pp_performers;
  std::vector<PersonId> pd_performers;
  for (const auto& [person, ordinal] : performers) {
    if (ordinal <= policy_.PerformerPerformerCap()) pp_performers.push_back(person);
    if (ordinal <= policy_.PerformerDirectorCap()) pd_performers.push_back(person);
  }
  const std::vector<PersonId> director_list(directors.begin(), directors.end());
  const std::vector<PersonId> crew_list(key_crew.begin(), key_crew.end());

  CandidateSet set(report);
  AddCrossPairs(set, CollaborationType::kPerformerDirector, RoleKind::kPerformer, pd_performers, RoleKind::kDirector, director_list);
  AddAllPairs(set, CollaborationType::kDirectorDirector, RoleKind::kDirector, director_list);
  AddAllPairs(set, CollaborationType::kPerformerPerformer, RoleKind::kPerformer, pp_performers);
  AddCrossPairs(set, CollaborationType::kDirectorCrew, RoleKind::kDirector, director_list, RoleKind::kCrew, crew_list);
  AddAllPairs(set, CollaborationType::kCrewCrew, RoleKind::kCrew, crew_list);

  output.candidates = set.Take();
  report.candidates = static_cast<std::int64_t>(output.candidates.size());
  return output;
}

} // namespace collab::graph

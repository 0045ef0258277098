#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "internal/db/model/work_record.hpp"
#include "internal/model/collaboration_type.hpp"
#include "internal/model/person_pair.hpp"
#include "internal/model/role.hpp"

namespace collab::runtime::config {
class EdgePolicyConfig;
}

namespace collab::graph {

/*
  Role based filtering policy.

  Only the top billed performers and an allow-list of crew jobs take part in
  pairing, which keeps the per-work candidate count independent of cast size.
*/
class EdgePolicy {
 public:
  EdgePolicy() = default;
  EdgePolicy(int performer_performer_cap, int performer_director_cap, const std::vector<std::string>& key_crew_roles);

  static EdgePolicy FromConfig(const collab::runtime::config::EdgePolicyConfig& config);

  int PerformerPerformerCap() const {
    return performer_performer_cap_;
  }

  int PerformerDirectorCap() const {
    return performer_director_cap_;
  }

  // case-insensitive
  bool IsKeyCrew(std::string_view role_name) const;

 private:
  int                             performer_performer_cap_ = 10;
  int                             performer_director_cap_  = 20;
  std::unordered_set<std::string> key_crew_roles_;
};

struct EdgeCandidate {
  model::PersonPair        pair;
  model::CollaborationType type      = model::CollaborationType::kUnspecified;
  model::RoleKind          low_role  = model::RoleKind::kUnspecified;
  model::RoleKind          high_role = model::RoleKind::kUnspecified;
};

struct BuildReport {
  std::int64_t candidates          = 0;
  std::int64_t skipped_credits     = 0;
  std::int64_t self_pairs_rejected = 0;
};

struct BuildOutput {
  // sorted by pair, one entry per pair
  std::vector<EdgeCandidate> candidates;
  BuildReport                report;
};

/*
  EdgeBuilder

  Turns the credit list of one work into canonical pair candidates. Pure:
  no I/O besides warn-level logging of skipped credits.
*/
class EdgeBuilder {
 public:
  explicit EdgeBuilder(EdgePolicy policy);

  BuildOutput Build(model::WorkId work_id, const std::vector<db::model::CreditRecord>& credits) const;

  const EdgePolicy& Policy() const {
    return policy_;
  }

 private:
  EdgePolicy policy_;
};

} // namespace collab::graph

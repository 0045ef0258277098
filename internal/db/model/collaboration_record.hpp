#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/collaboration_type.hpp"
#include "internal/model/person_pair.hpp"
#include "internal/model/role.hpp"

namespace collab::db::model {

using ::collab::model::CollaborationType;
using ::collab::model::PersonId;
using ::collab::model::PersonPair;
using ::collab::model::RoleKind;
using ::collab::model::TypeSet;
using ::collab::model::WorkId;

/*
  Aggregated pair row. One per unique pair, low id first.

  Every field is a pure function of the pair's detail rows, so a rebuild
  and any order of incremental applies converge on the same row.
*/
struct CollaborationRecord {
  PersonPair pair;

  std::int64_t collaboration_count = 0;
  std::int32_t first_year          = 0;
  std::int32_t last_year           = 0;

  // absent when no contributing work carries a rating
  std::optional<double> avg_rating;
  std::int64_t          total_revenue = 0;

  TypeSet types;

  std::vector<std::int32_t> years_active;
  std::int32_t              peak_year       = 0;
  double                    genre_diversity = 0.0;
  double                    role_diversity  = 0.0;

  std::uint64_t updated_at_ms = 0;
};

/*
  Per (pair, work) detail row.

  low_role / high_role are the role classes each side played for `type`.
*/
struct CollaborationDetailRecord {
  PersonPair pair;
  WorkId     work_id = 0;

  CollaborationType type      = CollaborationType::kUnspecified;
  RoleKind          low_role  = RoleKind::kUnspecified;
  RoleKind          high_role = RoleKind::kUnspecified;

  // denormalized work facts
  std::int32_t                year = 0;
  std::optional<double>       rating;
  std::optional<std::int64_t> revenue;
  std::vector<std::string>    genres;

  RoleKind RoleOf(PersonId person) const {
    return person == pair.low ? low_role : high_role;
  }

  bool SameContent(const CollaborationDetailRecord& other) const {
    return pair == other.pair && work_id == other.work_id && type == other.type && low_role == other.low_role &&
           high_role == other.high_role && year == other.year && rating == other.rating && revenue == other.revenue &&
           genres == other.genres;
  }
};

} // namespace collab::db::model

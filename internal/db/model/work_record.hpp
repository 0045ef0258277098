#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/person_pair.hpp"
#include "internal/model/role.hpp"

namespace collab::db::model {

using ::collab::model::PersonId;
using ::collab::model::RoleKind;
using ::collab::model::WorkId;

/*
  Catalog row for one work, written by the upstream sync.

  rating is 0..10 when known; revenue is non-negative when known.
*/
struct WorkRecord {
  WorkId       work_id      = 0;
  std::int32_t release_year = 0;

  std::optional<double>       rating;
  std::optional<std::int64_t> revenue;

  std::vector<std::string> genres;
};

/*
  One credit on a work.

  Upstream data is not trusted: person_id, billing_ordinal and role_name may
  be missing and the edge builder skips such rows.
*/
struct CreditRecord {
  WorkId                  work_id = 0;
  std::optional<PersonId> person_id;
  RoleKind                role_kind = RoleKind::kUnspecified;

  // crew job name ("Editor", "Producer"); empty for performers/directors
  std::string role_name;

  // performer billing order, lower = more prominent
  std::optional<std::int32_t> billing_ordinal;
};

} // namespace collab::db::model

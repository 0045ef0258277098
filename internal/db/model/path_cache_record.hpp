#pragma once

#include <cstdint>
#include <vector>

#include "internal/model/person_pair.hpp"

namespace collab::db::model {

using ::collab::model::PersonId;
using ::collab::model::PersonPair;

/*
  Cached shortest path for an unordered pair.

  path always runs from pair.low to pair.high; readers reverse it when the
  query was issued the other way round.
*/
struct PathCacheRecord {
  PersonPair            pair;
  std::vector<PersonId> path;
  std::int32_t          path_length    = 0;
  std::uint64_t         computed_at_ms = 0;
};

} // namespace collab::db::model

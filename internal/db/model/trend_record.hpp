#pragma once

#include <cstdint>

#include "internal/model/person_pair.hpp"

namespace collab::db::model {

using ::collab::model::PersonPair;

struct TrendRecord {
  PersonPair pair;

  double       trend_score    = 0.0;
  std::int64_t recent_count   = 0;
  std::int64_t baseline_count = 0;
  std::int32_t last_year      = 0;

  std::uint64_t refreshed_at_ms = 0;
};

// Row counts reported by stats().
struct GraphCounts {
  std::uint64_t works          = 0;
  std::uint64_t credits        = 0;
  std::uint64_t collaborations = 0;
  std::uint64_t details        = 0;
  std::uint64_t cached_paths   = 0;
  std::uint64_t trend_rows     = 0;
};

} // namespace collab::db::model

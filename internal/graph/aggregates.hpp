#pragma once

#include <cstdint>
#include <vector>

#include "internal/db/model/collaboration_record.hpp"

namespace collab::graph {

inline constexpr double kGenreDiversityScale = 10.0;

/*
  Recomputes a pair row from the pair's complete detail set.

  details must be ordered by work_id; sums are accumulated in that order so
  the result does not depend on the order works were applied in. Requires at
  least one detail.
*/
db::model::CollaborationRecord ComputeAggregates(const model::PersonPair& pair, const std::vector<db::model::CollaborationDetailRecord>& details,
                                                 std::uint64_t now_ms);

// Every field except updated_at_ms.
bool SameAggregates(const db::model::CollaborationRecord& a, const db::model::CollaborationRecord& b);

} // namespace collab::graph

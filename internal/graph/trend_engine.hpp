#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/util/single_flight.hpp"
#include "internal/util/time.hpp"

namespace collab::graph {

struct TrendEngineOptions {
  std::int32_t  window_years          = 2;
  std::uint32_t max_transient_retries = 5;
  util::ClockFn clock                 = util::Now;
};

struct TrendRefreshReport {
  std::uint64_t rows           = 0;
  std::int32_t  reference_year = 0;
};

/*
  TrendEngine

  Ranks pairs by recent collaboration velocity against their historical
  baseline. For a pair with details d and reference year R, window W:

      age(d)        = max(0, R - year(d))
      recent        = sum of 2^(-age(d) / W) over details with year > R - W
      baseline_rate = (#details with year <= R - W) / max(1, (R - W) - first_year)
      trend_score   = recent / (1 + baseline_rate)

  Pairs without any detail in the window are not ranked. The snapshot is
  replaced wholesale in one transaction.
*/
class TrendEngine {
 public:
  TrendEngine(std::shared_ptr<db::Repository> repository, TrendEngineOptions options = {});

  // Single-flight; throws util::AlreadyRunning when a refresh is in progress.
  TrendRefreshReport Refresh();

  std::vector<db::model::TrendRecord> TopTrending(std::size_t limit);

  // Scores a detail list at the given reference year; exposed for tests.
  static std::vector<db::model::TrendRecord> Score(const std::vector<db::model::CollaborationDetailRecord>& details, std::int32_t reference_year,
                                                   std::int32_t window_years, std::uint64_t now_ms);

 private:
  std::shared_ptr<db::Repository> repository_;
  TrendEngineOptions              options_;
  util::SingleFlight              refresh_flight_;
};

} // namespace collab::graph

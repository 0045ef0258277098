#include "internal/graph/trend_engine.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <stdexcept>
#include <utility>

#include "internal/graph/retry.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace collab::graph {

using observability::IntField;

namespace {

db::model::TrendRecord ScorePair(const model::PersonPair& pair, const std::vector<db::model::CollaborationDetailRecord>& details,
                                 std::size_t begin, std::size_t end, std::int32_t reference_year, std::int32_t window_years,
                                 std::uint64_t now_ms) {
  const std::int32_t window_start = reference_year - window_years;

  db::model::TrendRecord row;
  row.pair            = pair;
  row.refreshed_at_ms = now_ms;

  double       recent     = 0.0;
  std::int32_t first_year = details[begin].year;
  for (std::size_t i = begin; i < end; ++i) {
    const auto year = details[i].year;
    first_year      = std::min(first_year, year);
    row.last_year   = i == begin ? year : std::max(row.last_year, year);

    if (year > window_start) {
      const auto age = std::max(0, reference_year - year);
      recent += std::exp2(-static_cast<double>(age) / window_years);
      ++row.recent_count;
    } else {
      ++row.baseline_count;
    }
  }

  const double baseline_rate = static_cast<double>(row.baseline_count) / std::max(1, window_start - first_year);
  row.trend_score            = recent / (1.0 + baseline_rate);
  return row;
}

} // namespace

TrendEngine::TrendEngine(std::shared_ptr<db::Repository> repository, TrendEngineOptions options)
    : repository_(std::move(repository)), options_(std::move(options)) {
  if (!repository_) {
    throw std::invalid_argument("TrendEngine requires a repository");
  }
  if (options_.window_years <= 0) {
    throw std::invalid_argument("trend window must be positive");
  }
}

std::vector<db::model::TrendRecord> TrendEngine::Score(const std::vector<db::model::CollaborationDetailRecord>& details,
                                                       std::int32_t reference_year, std::int32_t window_years, std::uint64_t now_ms) {
  std::vector<db::model::TrendRecord> rows;

  // details arrive grouped by pair
  std::size_t begin = 0;
  while (begin < details.size()) {
    std::size_t end = begin;
    while (end < details.size() && details[end].pair == details[begin].pair) ++end;

    auto row = ScorePair(details[begin].pair, details, begin, end, reference_year, window_years, now_ms);
    if (row.recent_count > 0) {
      rows.push_back(row);
    }
    begin = end;
  }
  return rows;
}

TrendRefreshReport TrendEngine::Refresh() {
  const auto ticket = refresh_flight_.Acquire("trend refresh");

  observability::SpanScope span("graph.refresh_trends");
  const auto started = std::chrono::steady_clock::now();

  const auto now            = options_.clock();
  const auto now_ms         = util::ToUnixMillis(now);
  const auto reference_year = util::UtcYear(now);

  TrendRefreshReport report;
  report.reference_year = reference_year;
  report.rows           = RunWithRetries("refresh_trends", options_.max_transient_retries, [&](std::int32_t) {
    auto       tx   = repository_->Begin();
    const auto rows = Score(repository_->ListAllDetails(*tx), reference_year, options_.window_years, now_ms);
    ThrowIfError(repository_->ReplaceTrendSnapshot(*tx, rows), "replace trend snapshot");
    tx->Commit();
    return static_cast<std::uint64_t>(rows.size());
  });

  const double elapsed_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
  observability::Metrics::Instance().ObservePopulationDurationMs(observability::PopulationOp::kTrendRefresh, elapsed_ms);
  span.SetAttribute("rows", static_cast<std::int64_t>(report.rows));

  COLLAB_LOG_INFO("trend snapshot refreshed", {IntField("rows", static_cast<std::int64_t>(report.rows)), IntField("reference_year", reference_year),
                                               observability::DoubleField("duration_ms", elapsed_ms)});
  return report;
}

std::vector<db::model::TrendRecord> TrendEngine::TopTrending(std::size_t limit) {
  return RunWithRetries("top_trending", options_.max_transient_retries, [&](std::int32_t) {
    auto tx   = repository_->Begin();
    auto rows = repository_->ListTrending(*tx, limit);
    tx->Commit();
    return rows;
  });
}

} // namespace collab::graph

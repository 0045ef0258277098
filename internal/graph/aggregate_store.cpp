#include "internal/graph/aggregate_store.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <string>
#include <utility>

#include "internal/graph/aggregates.hpp"
#include "internal/graph/retry.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/population/apply_worker_pool.hpp"
#include "internal/util/errors.hpp"

namespace collab::graph {

using observability::IntField;
using observability::StringField;

namespace {

db::model::CollaborationDetailRecord ToDetail(const db::model::WorkRecord& work, const EdgeCandidate& candidate) {
  db::model::CollaborationDetailRecord detail;
  detail.pair      = candidate.pair;
  detail.work_id   = work.work_id;
  detail.type      = candidate.type;
  detail.low_role  = candidate.low_role;
  detail.high_role = candidate.high_role;
  detail.year      = work.release_year;
  detail.rating    = work.rating;
  detail.revenue   = work.revenue;
  detail.genres    = work.genres;
  return detail;
}

} // namespace

AggregateStore::AggregateStore(std::shared_ptr<db::Repository> repository, EdgeBuilder builder, AggregateStoreOptions options,
                               std::shared_ptr<population::ApplyWorkerPool> pool)
    : repository_(std::move(repository)), builder_(std::move(builder)), options_(std::move(options)), pool_(std::move(pool)) {
  if (!repository_) {
    throw std::invalid_argument("AggregateStore requires a repository");
  }
}

void AggregateStore::ApplyInTx(db::Transaction& tx, const db::model::WorkRecord& work, const BuildOutput& build, ApplyReport& report) {
  auto candidates = build.candidates;
  std::sort(candidates.begin(), candidates.end(), [](const EdgeCandidate& a, const EdgeCandidate& b) { return a.pair < b.pair; });

  for (const auto& candidate : candidates) {
    ThrowIfError(repository_->LockPair(tx, candidate.pair), "lock pair");
  }

  const auto now_ms = util::ToUnixMillis(options_.clock());

  for (const auto& candidate : candidates) {
    const auto detail   = ToDetail(work, candidate);
    const auto existing = repository_->GetDetail(tx, candidate.pair, work.work_id);

    bool changed = false;
    if (!existing) {
      const auto inserted = repository_->InsertDetail(tx, detail);
      if (inserted.code == db::ErrorCode::AlreadyExists) {
        ++report.details_unchanged;
      } else {
        ThrowIfError(inserted, "insert detail");
        ++report.details_inserted;
        changed = true;
      }
    } else if (existing->SameContent(detail)) {
      ++report.details_unchanged;
    } else {
      ThrowIfError(repository_->UpdateDetail(tx, detail), "update detail");
      ++report.details_updated;
      changed = true;
    }

    if (!changed && repository_->GetCollaboration(tx, candidate.pair)) {
      continue;
    }

    const auto details = repository_->ListDetailsForPair(tx, candidate.pair);
    ThrowIfError(repository_->UpsertCollaboration(tx, ComputeAggregates(candidate.pair, details, now_ms)), "upsert collaboration");
  }
}

ApplyReport AggregateStore::Apply(const db::model::WorkRecord& work, const BuildOutput& build) {
  return RunWithRetries("apply", options_.max_transient_retries, [&](std::int32_t attempt) {
    ApplyReport report;
    report.work_id  = work.work_id;
    report.build    = build.report;
    report.attempts = attempt;

    auto tx = repository_->Begin();
    ApplyInTx(*tx, work, build, report);
    tx->Commit();
    return report;
  });
}

ApplyReport AggregateStore::ApplyIncremental(model::WorkId work_id) {
  observability::SpanScope span("graph.apply_incremental");
  span.SetAttribute("work_id", static_cast<std::int64_t>(work_id));
  const auto started = std::chrono::steady_clock::now();

  auto report = RunWithRetries("apply_incremental", options_.max_transient_retries, [&](std::int32_t attempt) {
    auto tx   = repository_->Begin();
    auto work = repository_->GetWork(*tx, work_id);
    if (!work) {
      throw util::InvalidArgument("unknown work: " + std::to_string(work_id));
    }

    const auto credits = repository_->ListCredits(*tx, work_id);
    const auto build   = builder_.Build(work_id, credits);

    ApplyReport report;
    report.work_id  = work_id;
    report.build    = build.report;
    report.attempts = attempt;

    ApplyInTx(*tx, *work, build, report);
    tx->Commit();
    return report;
  });

  const double elapsed_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
  observability::Metrics::Instance().ObservePopulationDurationMs(observability::PopulationOp::kApply, elapsed_ms);
  COLLAB_LOG_DEBUG("work applied", {IntField("work_id", work_id), IntField("candidates", report.build.candidates),
                                    IntField("inserted", report.details_inserted), IntField("updated", report.details_updated),
                                    IntField("unchanged", report.details_unchanged), IntField("attempts", report.attempts)});
  return report;
}

RebuildReport AggregateStore::RebuildAll() {
  const auto ticket = rebuild_flight_.Acquire("rebuild");

  observability::SpanScope span("graph.rebuild_all");
  const auto started = std::chrono::steady_clock::now();

  const auto work_ids = RunWithRetries("rebuild_all.reset", options_.max_transient_retries, [&](std::int32_t) {
    auto tx = repository_->Begin();
    ThrowIfError(repository_->DeleteAllCollaborations(*tx), "delete collaborations");
    auto ids = repository_->ListWorkIds(*tx);
    tx->Commit();
    return ids;
  });

  COLLAB_LOG_INFO("rebuild started", {IntField("works", static_cast<std::int64_t>(work_ids.size())),
                                      IntField("workers", pool_ ? static_cast<std::int64_t>(pool_->Size()) : 1)});

  RebuildReport report;
  if (pool_) {
    const auto batch     = pool_->RunAll(work_ids, [this](model::WorkId work_id) { ApplyIncremental(work_id); });
    report.works_applied = batch.succeeded;
    report.works_failed  = batch.failed;
  } else {
    for (const auto work_id : work_ids) {
      try {
        ApplyIncremental(work_id);
        ++report.works_applied;
      } catch (const std::exception& e) {
        ++report.works_failed;
        COLLAB_LOG_ERROR("work apply failed", {IntField("work_id", work_id), StringField("error", e.what())});
      }
    }
  }

  report.pairs = RunWithRetries("rebuild_all.count", options_.max_transient_retries, [&](std::int32_t) {
    auto       tx     = repository_->Begin();
    const auto counts = repository_->CountRows(*tx);
    tx->Commit();
    return counts.collaborations;
  });

  report.duration_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
  observability::Metrics::Instance().ObservePopulationDurationMs(observability::PopulationOp::kRebuild, report.duration_ms);
  span.SetAttribute("pairs", static_cast<std::int64_t>(report.pairs));

  COLLAB_LOG_INFO("rebuild finished", {IntField("works_applied", static_cast<std::int64_t>(report.works_applied)),
                                       IntField("works_failed", static_cast<std::int64_t>(report.works_failed)),
                                       IntField("pairs", static_cast<std::int64_t>(report.pairs)),
                                       observability::DoubleField("duration_ms", report.duration_ms)});
  return report;
}

} // namespace collab::graph

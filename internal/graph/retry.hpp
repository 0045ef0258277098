#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <thread>

#include "internal/db/api/result.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace collab::graph {

inline constexpr std::int64_t kMaxBackoffMs = 100;

inline void Backoff(std::uint32_t attempt) {
  const auto shift = std::min<std::uint32_t>(attempt, 7);
  const auto ms    = std::min<std::int64_t>(std::int64_t{1} << shift, kMaxBackoffMs);
  std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

inline void ThrowIfError(const db::Result& result, const std::string& context) {
  if (result) return;
  throw db::DbError(result.code, context + ": " + result.message);
}

/*
  Runs fn(attempt) until it returns.

  Conflicts (snapshot conflict, serialization failure, deadlock) are retried
  without limit; Busy / IOError up to max_transient_retries times, then
  util::Unavailable. Any other error propagates unchanged.
*/
template <typename Fn>
auto RunWithRetries(std::string_view operation, std::uint32_t max_transient_retries, Fn&& fn) {
  std::uint32_t conflicts = 0;
  std::uint32_t transient = 0;

  for (std::int32_t attempt = 1;; ++attempt) {
    try {
      return fn(attempt);
    } catch (const db::DbError& e) {
      if (db::IsConflict(e.code())) {
        ++conflicts;
        COLLAB_LOG_DEBUG("retrying after conflict",
                         {observability::StringField("operation", operation), observability::IntField("attempt", attempt)});
        Backoff(conflicts);
        continue;
      }
      if (db::IsTransient(e.code())) {
        if (++transient > max_transient_retries) {
          throw util::Unavailable(std::string(operation) + ": store unavailable after " + std::to_string(max_transient_retries) +
                                  " retries: " + e.what());
        }
        COLLAB_LOG_WARN("retrying after transient store error", {observability::StringField("operation", operation),
                                                                 observability::IntField("attempt", attempt),
                                                                 observability::StringField("error", e.what())});
        Backoff(transient);
        continue;
      }
      throw;
    }
  }
}

} // namespace collab::graph

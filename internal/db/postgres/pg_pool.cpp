#include "pg_pool.hpp"

namespace collab::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        if (!conn->is_open()) {
          --live_connections_;
          continue;
        }
        return Wrap(conn.release());
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        try {
          auto conn = std::make_unique<pqxx::connection>(conninfo_);
          PrepareStatements(*conn);
          return Wrap(conn.release());
        } catch (...) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
      }

      cv_.wait(lock, [this] {
        return !idle_.empty() || live_connections_ < max_connections_;
      });
    }
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("get_work",
               "SELECT work_id,release_year,rating,revenue,genres FROM works WHERE work_id=$1");

  conn.prepare("person_exists", "SELECT 1 FROM credits WHERE person_id=$1 LIMIT 1");

  conn.prepare("lock_pair", "SELECT pg_advisory_xact_lock(hashtextextended('collab:' || $1::text || ':' || $2::text, 0))");

  conn.prepare("get_collaboration",
               "SELECT person_low_id,person_high_id,collaboration_count,first_year,last_year,avg_rating,total_revenue,"
               "types,years_active,peak_year,genre_diversity,role_diversity,updated_at_ms "
               "FROM collaborations WHERE person_low_id=$1 AND person_high_id=$2");

  conn.prepare("get_detail",
               "SELECT person_low_id,person_high_id,work_id,collaboration_type,low_role,high_role,release_year,rating,"
               "revenue,genres FROM collaboration_details WHERE person_low_id=$1 AND person_high_id=$2 AND work_id=$3");

  conn.prepare("insert_detail",
               "INSERT INTO collaboration_details(person_low_id,person_high_id,work_id,collaboration_type,low_role,"
               "high_role,release_year,rating,revenue,genres) VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10) "
               "ON CONFLICT(person_low_id,person_high_id,work_id) DO NOTHING");

  conn.prepare("get_path_cache",
               "SELECT person_low_id,person_high_id,path,path_length,computed_at_ms FROM path_cache "
               "WHERE person_low_id=$1 AND person_high_id=$2");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace collab::db::postgres

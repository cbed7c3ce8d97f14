#include "pg_pool.hpp"

namespace settle::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    std::unique_lock lock(mutex_);

    if (!idle_.empty()) {
      auto conn = std::move(idle_.back());
      idle_.pop_back();
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

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("insert_participant",
               "INSERT INTO participants(external_id,name,role) "
               "VALUES($1,$2,$3) RETURNING id");
  conn.prepare("get_participant", "SELECT id,external_id,name,role FROM participants WHERE id=$1");
  conn.prepare("get_participant_by_external_id", "SELECT id,external_id,name,role FROM participants WHERE external_id=$1");
  conn.prepare("list_participants", "SELECT id,external_id,name,role FROM participants ORDER BY id ASC");

  conn.prepare("insert_event",
               "INSERT INTO usage_events(participant_id,kind,quantity,unit,timestamp_ms,source,price_per_unit) "
               "VALUES($1,$2,$3,$4,$5,$6,$7) RETURNING id");
  conn.prepare("list_events_in_window",
               "SELECT id,participant_id,kind,quantity,unit,timestamp_ms,source,price_per_unit FROM usage_events "
               "WHERE timestamp_ms>=$1 AND timestamp_ms<$2 ORDER BY timestamp_ms ASC, id ASC");

  conn.prepare("insert_policy", "INSERT INTO policies(use_case,body_json,created_at_ms) VALUES($1,$2,$3) RETURNING id");
  conn.prepare("get_policy", "SELECT id,use_case,body_json,created_at_ms FROM policies WHERE id=$1");

  conn.prepare("insert_batch",
               "INSERT INTO settlement_batches(use_case,start_ms,end_ms,created_at_ms,policy_id) "
               "VALUES($1,$2,$3,$4,$5) RETURNING id");
  conn.prepare("get_batch", "SELECT id,use_case,start_ms,end_ms,created_at_ms,policy_id FROM settlement_batches WHERE id=$1");
  conn.prepare("list_overlapping_batches",
               "SELECT id,use_case,start_ms,end_ms,created_at_ms,policy_id FROM settlement_batches "
               "WHERE use_case=$1 AND start_ms<$2 AND end_ms>$3 ORDER BY id ASC");

  conn.prepare("insert_line",
               "INSERT INTO settlement_lines(batch_id,participant_id,amount_cents,description,proof_hash) "
               "VALUES($1,$2,$3,$4,$5) RETURNING id");
  conn.prepare("list_lines",
               "SELECT id,batch_id,participant_id,amount_cents,description,proof_hash FROM settlement_lines "
               "WHERE batch_id=$1 ORDER BY id ASC");
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

} // namespace settle::db::postgres

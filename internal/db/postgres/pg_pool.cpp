#include "pg_pool.hpp"

namespace booking::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] {
    return !idle_.empty() || live_connections_ < max_connections_;
  });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    if (conn->is_open()) {
      return Wrap(conn.release());
    }
    // dropped by the server while idle; replace it below
    --live_connections_;
  }

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

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("get_booking",
               "SELECT id, resource_id, start_ms, end_ms, status, payload, created_at_ms, updated_at_ms "
               "FROM booking WHERE id=$1");

  // Row lock; under READ COMMITTED a waiter re-reads the committed row.
  conn.prepare("lock_booking",
               "SELECT id, resource_id, start_ms, end_ms, status, payload, created_at_ms, updated_at_ms "
               "FROM booking WHERE id=$1 FOR UPDATE");

  conn.prepare("insert_booking",
               "INSERT INTO booking(id,resource_id,start_ms,end_ms,status,payload,created_at_ms,updated_at_ms) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8)");

  conn.prepare("update_booking",
               "UPDATE booking SET resource_id=$2,start_ms=$3,end_ms=$4,status=$5,payload=$6,updated_at_ms=$7 "
               "WHERE id=$1");

  conn.prepare("upsert_resource",
               "INSERT INTO resource(id,display_name) VALUES($1,$2) "
               "ON CONFLICT(id) DO UPDATE SET display_name=EXCLUDED.display_name");

  conn.prepare("list_resources", "SELECT id, display_name FROM resource ORDER BY id");

  // Resource writers share the pool lock and own their resource key;
  // unassigned writers take the pool lock exclusively.
  conn.prepare("lock_pool_shared", "SELECT pg_advisory_xact_lock_shared(2, 0)");
  conn.prepare("lock_pool_exclusive", "SELECT pg_advisory_xact_lock(2, 0)");
  conn.prepare("lock_resource", "SELECT pg_advisory_xact_lock(1, hashtext($1))");
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

} // namespace booking::db::postgres

#include "pg_tx.hpp"

#include <algorithm>
#include <chrono>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/db/postgres/pg_error.hpp"
#include "internal/observability/logging.hpp"

namespace booking::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool, std::optional<util::TimePoint> deadline) {
  try {
    conn_ = pool->Acquire();
    tx_   = std::make_unique<pqxx::work>(*conn_);

    if (deadline) {
      const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - util::Now()).count();
      if (remaining <= 0) {
        throw db::DbError(ErrorCode::Timeout, "postgres transaction deadline exceeded before start");
      }
      tx_->exec("SET LOCAL statement_timeout = " + std::to_string(remaining));
    }
  } catch (const db::DbError&) {
    throw;
  } catch (const std::exception& e) {
    throw db::DbError(Classify(e), e.what());
  }
}

PgTransaction::~PgTransaction() {
  if (!finished_ && tx_) {
    try {
      tx_->abort();
    } catch (const std::exception& e) {
      BOOKING_LOG_WARN("postgres rollback failed", {observability::StringField("error", e.what())});
    }
  }
}

void PgTransaction::Commit() {
  try {
    tx_->commit();
  } catch (const std::exception& e) {
    finished_ = true; // pqxx already closed the transaction
    throw db::DbError(Classify(e), e.what());
  }
  committed_ = true;
  finished_  = true;
}

void PgTransaction::Rollback() {
  tx_->abort();
  finished_ = true;
}

}

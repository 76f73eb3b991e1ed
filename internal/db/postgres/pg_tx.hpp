#pragma once

#include <memory>
#include <optional>
#include <pqxx/pqxx>

#include "internal/db/api/transaction.hpp"
#include "internal/util/time.hpp"
#include "pg_pool.hpp"

namespace booking::db::postgres {

/*
  pqxx::work on a pooled connection. A deadline becomes
  SET LOCAL statement_timeout for the remaining time.
*/
class PgTransaction final : public db::Transaction {
public:
  PgTransaction(std::shared_ptr<PgPool> pool, std::optional<util::TimePoint> deadline);
  ~PgTransaction();

  pqxx::work& Work() { return *tx_; }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<pqxx::work> tx_;
  bool committed_ = false;
  bool finished_  = false;
};

}

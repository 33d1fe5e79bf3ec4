#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <pqxx/pqxx>

#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace tablebook::db::postgres {

/*
  One pooled connection plus one pqxx::work.

  With a statement budget, every statement of the transaction runs
  under SET LOCAL statement_timeout (SQLSTATE 57014 -> ErrorCode::Timeout).
*/
class PgTransaction final : public db::Transaction {
public:
  PgTransaction(std::shared_ptr<PgPool> pool,
                std::optional<std::chrono::milliseconds> statement_budget = std::nullopt);
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

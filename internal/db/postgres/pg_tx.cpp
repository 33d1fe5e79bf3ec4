#include "pg_tx.hpp"

#include <algorithm>
#include <string>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace tablebook::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool, std::optional<std::chrono::milliseconds> statement_budget)
{
  conn_ = pool->Acquire();
  tx_ = std::make_unique<pqxx::work>(*conn_);
  if (statement_budget) {
    const auto ms = std::max<long long>(1, statement_budget->count());
    tx_->exec("SET LOCAL statement_timeout = " + std::to_string(ms));
  }
}

PgTransaction::~PgTransaction() {
  if (!finished_) {
    try {
      tx_->abort();
    } catch (const std::exception& e) {
      TABLEBOOK_LOG_WARN("postgres rollback failed", {observability::StringField("error", e.what())});
    }
  }
}

void PgTransaction::Commit() {
  if (finished_) {
    throw util::StorageError(ErrorCode::InternalError, "postgres commit: transaction already finished");
  }
  finished_ = true;
  try {
    tx_->commit();
  } catch (const pqxx::sql_error& e) {
    const auto state = e.sqlstate();
    throw util::StorageError(state == "40001" ? ErrorCode::SerializationFailure
                             : state.rfind("23", 0) == 0 ? ErrorCode::ConstraintViolation
                                                         : ErrorCode::InternalError,
                             std::string("postgres commit: ") + e.what());
  } catch (const pqxx::broken_connection& e) {
    throw util::StorageError(ErrorCode::ConnectionLost, std::string("postgres commit: ") + e.what());
  } catch (const pqxx::in_doubt_error& e) {
    throw util::StorageError(ErrorCode::InternalError, std::string("postgres commit in doubt: ") + e.what());
  }
  committed_ = true;
}

void PgTransaction::Rollback() {
  if (finished_) return;
  finished_ = true;
  tx_->abort();
}

}

#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace tablebook::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db, Mode mode,
                                     std::optional<std::chrono::steady_clock::time_point> deadline)
    : db_(std::move(db)), connection_lock_(db_->Lock()), deadline_(deadline) {
  if (deadline_) {
    // checked every 1000 VM instructions
    sqlite3_progress_handler(db_->Handle(), 1000, &SqliteTransaction::ProgressHandler, this);
  }
  try {
    db_->Exec(mode == Mode::kImmediate ? "BEGIN IMMEDIATE;" : "BEGIN DEFERRED;");
  } catch (...) {
    if (deadline_) sqlite3_progress_handler(db_->Handle(), 0, nullptr, nullptr);
    throw;
  }
}

SqliteTransaction::~SqliteTransaction() {
  if (!finished_) {
    try {
      db_->Exec("ROLLBACK;");
    } catch (const std::exception& e) {
      TABLEBOOK_LOG_WARN("sqlite rollback failed", {observability::StringField("error", e.what())});
    }
  }
  if (deadline_) sqlite3_progress_handler(db_->Handle(), 0, nullptr, nullptr);
}

int SqliteTransaction::ProgressHandler(void* self) {
  auto* tx = static_cast<SqliteTransaction*>(self);
  return tx->deadline_ && std::chrono::steady_clock::now() >= *tx->deadline_ ? 1 : 0;
}

void SqliteTransaction::Commit() {
  if (finished_) {
    throw util::StorageError(ErrorCode::InternalError, "sqlite commit: transaction already finished");
  }
  db_->Exec("COMMIT;");
  committed_ = true;
  finished_  = true;
}

void SqliteTransaction::Rollback() {
  if (finished_) return;
  finished_ = true;
  db_->Exec("ROLLBACK;");
}

} // namespace tablebook::db::sqlite

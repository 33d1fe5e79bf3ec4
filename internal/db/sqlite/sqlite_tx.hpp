#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace tablebook::db::sqlite {

/*
  SQLite transaction wrapper.

  Write transactions use BEGIN IMMEDIATE:
    - grabs write lock early
    - avoids deadlock-y behavior later
  Read transactions use BEGIN DEFERRED.

  With a deadline, a progress handler interrupts any statement still
  running past it (SQLITE_INTERRUPT -> ErrorCode::Timeout).
*/
class SqliteTransaction final : public db::Transaction {
public:
  enum class Mode { kImmediate, kDeferred };

  SqliteTransaction(std::shared_ptr<SqliteDB> db, Mode mode,
                    std::optional<std::chrono::steady_clock::time_point> deadline = std::nullopt);
  ~SqliteTransaction();

  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  static int ProgressHandler(void* self);

  std::shared_ptr<SqliteDB>    db_;
  std::unique_lock<std::mutex> connection_lock_;
  std::optional<std::chrono::steady_clock::time_point> deadline_;
  bool committed_ = false;
  bool finished_  = false;
};

}

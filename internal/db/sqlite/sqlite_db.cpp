#include "sqlite_db.hpp"

#include "internal/util/errors.hpp"

namespace tablebook::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw util::StorageError(ErrorCode::IOError, std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path, SqliteOptions options) : path_(std::move(path)), options_(options) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw util::StorageError(ErrorCode::IOError, "sqlite open " + path_ + ": " + msg);
  }

  Configure();
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);

    const int primary = rc & 0xff;
    ErrorCode code    = ErrorCode::InternalError;
    if (primary == SQLITE_BUSY || primary == SQLITE_LOCKED) code = ErrorCode::Busy;
    else if (primary == SQLITE_CONSTRAINT) code = ErrorCode::ConstraintViolation;
    else if (primary == SQLITE_ERROR) code = ErrorCode::SyntaxError;
    else if (primary == SQLITE_INTERRUPT) code = ErrorCode::Timeout;
    throw util::StorageError(code, msg);
  }
}

void SqliteDB::Configure() {
  // WAL enables concurrent readers from other processes while we write
  if (options_.wal_mode) Exec("PRAGMA journal_mode=WAL;");

  Exec("PRAGMA synchronous=NORMAL;");

  // foreign keys are OFF by default in sqlite
  Exec("PRAGMA foreign_keys=ON;");

  // wait for locks held by other processes instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, static_cast<int>(options_.busy_timeout_ms)), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
}

} // namespace tablebook::db::sqlite

#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <sstream>

#include "internal/db/sql/sql_queries.hpp"
#include "internal/model/booking_state.hpp"
#include "internal/util/errors.hpp"

namespace tablebook::db::sqlite {

using tablebook::db::ErrorCode;
using tablebook::db::Result;

namespace {

/*
  Prepared statement owned for the duration of one repository call.
*/
class Statement {
 public:
  Statement(sqlite3* db, const char* sql) : db_(db) {
    const int rc = sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr);
    if (rc != SQLITE_OK) {
      auto result = SqliteRepository::Translate(db, rc, true);
      sqlite3_finalize(stmt_);
      stmt_ = nullptr;
      throw util::StorageError(result.code, "sqlite prepare: " + result.message);
    }
  }

  ~Statement() {
    sqlite3_finalize(stmt_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const {
    return stmt_;
  }

  // Runs a statement that returns no rows.
  Result Run() {
    return SqliteRepository::Translate(db_, sqlite3_step(stmt_));
  }

  // Advances to the next row; false when the result set is exhausted.
  bool Next() {
    const int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    auto result = SqliteRepository::Translate(db_, rc);
    throw util::StorageError(result.code, "sqlite step: " + result.message);
  }

 private:
  sqlite3*      db_;
  sqlite3_stmt* stmt_ = nullptr;
};

template <typename Fn>
Result Guard(Fn&& fn) {
  try {
    return fn();
  } catch (const util::StorageError& e) {
    return Result::Err(e.code(), e.what());
  }
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

std::string JoinIds(const std::vector<std::string>& ids) {
  std::string out;
  for (size_t i = 0; i < ids.size(); ++i) {
    if (i) out += ',';
    out += ids[i];
  }
  return out;
}

std::vector<std::string> SplitIds(const std::string& joined) {
  std::vector<std::string> out;
  std::stringstream        in(joined);
  std::string              item;
  while (std::getline(in, item, ','))
    if (!item.empty()) out.push_back(item);
  return out;
}

model::TableRecord ReadTable(sqlite3_stmt* st) {
  model::TableRecord r;
  r.id                 = ColText(st, 0);
  r.restaurant_id      = ColText(st, 1);
  r.number             = ColText(st, 2);
  r.min_capacity       = static_cast<uint32_t>(ColI64(st, 3));
  r.max_capacity       = static_cast<uint32_t>(ColI64(st, 4));
  r.combinable         = ColI64(st, 5) != 0;
  r.active             = ColI64(st, 6) != 0;
  r.priority           = static_cast<int32_t>(ColI64(st, 7));
  r.section            = ColText(st, 8);
  r.adjacent_table_ids = SplitIds(ColText(st, 9));
  return r;
}

model::TurnTimeRuleRecord ReadRule(sqlite3_stmt* st) {
  model::TurnTimeRuleRecord r;
  r.id               = ColText(st, 0);
  r.restaurant_id    = ColText(st, 1);
  r.name             = ColText(st, 2);
  r.min_party_size   = static_cast<uint32_t>(ColI64(st, 3));
  r.max_party_size   = static_cast<uint32_t>(ColI64(st, 4));
  r.duration_minutes = static_cast<uint32_t>(ColI64(st, 5));
  r.priority         = static_cast<int32_t>(ColI64(st, 6));
  r.active           = ColI64(st, 7) != 0;
  return r;
}

model::BookingRecord ReadBooking(sqlite3_stmt* st) {
  model::BookingRecord r;
  r.id                = ColText(st, 0);
  r.restaurant_id     = ColText(st, 1);
  r.date              = ColText(st, 2);
  r.start_minute      = static_cast<int32_t>(ColI64(st, 3));
  r.duration_minutes  = static_cast<uint32_t>(ColI64(st, 4));
  r.party_size        = static_cast<uint32_t>(ColI64(st, 5));
  r.status            = static_cast<tablebook::core::v1::BookingStatus>(ColI64(st, 6));
  r.source            = static_cast<tablebook::core::v1::BookingSource>(ColI64(st, 7));
  r.customer_name     = ColText(st, 8);
  r.customer_email    = ColText(st, 9);
  r.customer_phone    = ColText(st, 10);
  r.notes             = ColText(st, 11);
  r.pacing_overridden = ColI64(st, 12) != 0;
  r.override_reason   = ColText(st, 13);
  r.created_by        = ColText(st, 14);
  r.confirmation_code = ColText(st, 15);
  r.created_at_ms     = static_cast<uint64_t>(ColI64(st, 16));
  r.updated_at_ms     = static_cast<uint64_t>(ColI64(st, 17));
  r.version           = static_cast<uint64_t>(ColI64(st, 18));
  return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_, SqliteTransaction::Mode::kImmediate);
}

std::unique_ptr<db::Transaction> SqliteRepository::BeginRead() {
  return std::make_unique<SqliteTransaction>(db_, SqliteTransaction::Mode::kDeferred);
}

std::unique_ptr<db::Transaction> SqliteRepository::BeginBounded(std::chrono::milliseconds budget) {
  return std::make_unique<SqliteTransaction>(db_, SqliteTransaction::Mode::kImmediate,
                                             std::chrono::steady_clock::now() + budget);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc, bool prepare) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
    return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_INTERRUPT:
      return Result::Err(ErrorCode::Timeout, sqlite3_errmsg(db));
    case SQLITE_IOERR:
    case SQLITE_FULL:
    case SQLITE_CANTOPEN:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    case SQLITE_ERROR:
      // missing table/column or bad SQL when compiling the statement
      return Result::Err(prepare ? ErrorCode::SyntaxError : ErrorCode::InternalError, sqlite3_errmsg(db));
    case SQLITE_SCHEMA:
      return Result::Err(ErrorCode::SerializationFailure, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Restaurants
// ------------------------------------------------------------------

Result SqliteRepository::UpsertRestaurant(Transaction& t, const model::RestaurantRecord& r) {
  return Guard([&] {
    Statement st(TX(t).Handle(), sql::UPSERT_RESTAURANT);
    BindText(st.get(), 1, r.id);
    BindText(st.get(), 2, r.name);
    BindText(st.get(), 3, r.definition_json);
    BindU64(st.get(), 4, r.updated_at_ms);
    return st.Run();
  });
}

std::optional<model::RestaurantRecord> SqliteRepository::GetRestaurant(Transaction& t, const std::string& id) {
  Statement st(TX(t).Handle(), sql::SELECT_RESTAURANT);
  BindText(st.get(), 1, id);
  if (!st.Next()) return std::nullopt;

  model::RestaurantRecord r;
  r.id              = ColText(st.get(), 0);
  r.name            = ColText(st.get(), 1);
  r.definition_json = ColText(st.get(), 2);
  r.updated_at_ms   = static_cast<uint64_t>(ColI64(st.get(), 3));
  return r;
}

// ------------------------------------------------------------------
// Tables
// ------------------------------------------------------------------

Result SqliteRepository::UpsertTable(Transaction& t, const model::TableRecord& r) {
  return Guard([&] {
    Statement st(TX(t).Handle(), sql::UPSERT_TABLE);
    BindText(st.get(), 1, r.id);
    BindText(st.get(), 2, r.restaurant_id);
    BindText(st.get(), 3, r.number);
    BindI64(st.get(), 4, r.min_capacity);
    BindI64(st.get(), 5, r.max_capacity);
    BindI64(st.get(), 6, r.combinable ? 1 : 0);
    BindI64(st.get(), 7, r.active ? 1 : 0);
    BindI64(st.get(), 8, r.priority);
    BindText(st.get(), 9, r.section);
    BindText(st.get(), 10, JoinIds(r.adjacent_table_ids));
    return st.Run();
  });
}

Result SqliteRepository::DeactivateTable(Transaction& t, const std::string& id) {
  return Guard([&] {
    auto*     db = TX(t).Handle();
    Statement st(db, sql::DEACTIVATE_TABLE);
    BindText(st.get(), 1, id);
    auto result = st.Run();
    if (result && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "table " + id);
    return result;
  });
}

std::vector<model::TableRecord> SqliteRepository::ListTables(Transaction& t, const std::string& restaurant_id) {
  Statement st(TX(t).Handle(), sql::SELECT_TABLES);
  BindText(st.get(), 1, restaurant_id);

  std::vector<model::TableRecord> out;
  while (st.Next()) out.push_back(ReadTable(st.get()));
  return out;
}

// ------------------------------------------------------------------
// Turn-time rules
// ------------------------------------------------------------------

Result SqliteRepository::UpsertTurnTimeRule(Transaction& t, const model::TurnTimeRuleRecord& r) {
  return Guard([&] {
    Statement st(TX(t).Handle(), sql::UPSERT_TURN_TIME_RULE);
    BindText(st.get(), 1, r.id);
    BindText(st.get(), 2, r.restaurant_id);
    BindText(st.get(), 3, r.name);
    BindI64(st.get(), 4, r.min_party_size);
    BindI64(st.get(), 5, r.max_party_size);
    BindI64(st.get(), 6, r.duration_minutes);
    BindI64(st.get(), 7, r.priority);
    BindI64(st.get(), 8, r.active ? 1 : 0);
    return st.Run();
  });
}

std::vector<model::TurnTimeRuleRecord> SqliteRepository::ListTurnTimeRules(Transaction& t, const std::string& restaurant_id) {
  Statement st(TX(t).Handle(), sql::SELECT_TURN_TIME_RULES);
  BindText(st.get(), 1, restaurant_id);

  std::vector<model::TurnTimeRuleRecord> out;
  while (st.Next()) out.push_back(ReadRule(st.get()));
  return out;
}

// ------------------------------------------------------------------
// Bookings
// ------------------------------------------------------------------

Result SqliteRepository::WriteClaims(sqlite3* db, const model::BookingRecord& r) {
  {
    Statement del(db, sql::DELETE_BOOKING_TABLES);
    BindText(del.get(), 1, r.id);
    if (auto result = del.Run(); !result) return result;
  }

  const bool occupying = tablebook::model::OccupiesTable(r.status);
  for (size_t i = 0; i < r.table_ids.size(); ++i) {
    Statement st(db, sql::INSERT_BOOKING_TABLE);
    BindText(st.get(), 1, r.id);
    BindText(st.get(), 2, r.table_ids[i]);
    BindI64(st.get(), 3, static_cast<int64_t>(i));
    BindText(st.get(), 4, r.date);
    BindI64(st.get(), 5, r.start_minute);
    BindI64(st.get(), 6, r.start_minute + static_cast<int64_t>(r.duration_minutes));
    BindI64(st.get(), 7, occupying ? 1 : 0);
    if (auto result = st.Run(); !result) return result;
  }
  return Result::Ok();
}

std::vector<std::string> SqliteRepository::ReadClaims(sqlite3* db, const std::string& booking_id) {
  Statement st(db, sql::SELECT_BOOKING_TABLES);
  BindText(st.get(), 1, booking_id);

  std::vector<std::string> out;
  while (st.Next()) out.push_back(ColText(st.get(), 0));
  return out;
}

Result SqliteRepository::InsertBooking(Transaction& t, const model::BookingRecord& r) {
  return Guard([&] {
    auto* db = TX(t).Handle();
    {
      Statement st(db, sql::INSERT_BOOKING);
      BindText(st.get(), 1, r.id);
      BindText(st.get(), 2, r.restaurant_id);
      BindText(st.get(), 3, r.date);
      BindI64(st.get(), 4, r.start_minute);
      BindI64(st.get(), 5, r.duration_minutes);
      BindI64(st.get(), 6, r.party_size);
      BindI64(st.get(), 7, static_cast<int64_t>(r.status));
      BindI64(st.get(), 8, static_cast<int64_t>(r.source));
      BindText(st.get(), 9, r.customer_name);
      BindText(st.get(), 10, r.customer_email);
      BindText(st.get(), 11, r.customer_phone);
      BindText(st.get(), 12, r.notes);
      BindI64(st.get(), 13, r.pacing_overridden ? 1 : 0);
      BindText(st.get(), 14, r.override_reason);
      BindText(st.get(), 15, r.created_by);
      BindText(st.get(), 16, r.confirmation_code);
      BindU64(st.get(), 17, r.created_at_ms);
      BindU64(st.get(), 18, r.updated_at_ms);
      BindU64(st.get(), 19, r.version);

      auto result = st.Run();
      if (result.code == ErrorCode::ConstraintViolation && sqlite3_extended_errcode(db) == SQLITE_CONSTRAINT_PRIMARYKEY) {
        return Result::Err(ErrorCode::AlreadyExists, "booking " + r.id);
      }
      if (!result) return result;
    }
    return WriteClaims(db, r);
  });
}

Result SqliteRepository::UpdateBooking(Transaction& t, const model::BookingRecord& r) {
  return Guard([&] {
    auto* db = TX(t).Handle();
    {
      Statement st(db, sql::UPDATE_BOOKING);
      BindText(st.get(), 1, r.date);
      BindI64(st.get(), 2, r.start_minute);
      BindI64(st.get(), 3, r.duration_minutes);
      BindI64(st.get(), 4, r.party_size);
      BindI64(st.get(), 5, static_cast<int64_t>(r.status));
      BindI64(st.get(), 6, static_cast<int64_t>(r.source));
      BindText(st.get(), 7, r.customer_name);
      BindText(st.get(), 8, r.customer_email);
      BindText(st.get(), 9, r.customer_phone);
      BindText(st.get(), 10, r.notes);
      BindI64(st.get(), 11, r.pacing_overridden ? 1 : 0);
      BindText(st.get(), 12, r.override_reason);
      BindU64(st.get(), 13, r.updated_at_ms);
      BindU64(st.get(), 14, r.version);
      BindText(st.get(), 15, r.id);
      BindU64(st.get(), 16, r.version - 1);

      auto result = st.Run();
      if (!result) return result;
    }

    if (sqlite3_changes(db) == 0) {
      Statement exists(db, sql::BOOKING_EXISTS);
      BindText(exists.get(), 1, r.id);
      if (!exists.Next()) return Result::Err(ErrorCode::NotFound, "booking " + r.id);
      return Result::Err(ErrorCode::Conflict, "booking " + r.id + " version mismatch");
    }
    return WriteClaims(db, r);
  });
}

std::optional<model::BookingRecord> SqliteRepository::GetBooking(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  std::optional<model::BookingRecord> out;
  {
    Statement st(db, sql::SELECT_BOOKING);
    BindText(st.get(), 1, id);
    if (!st.Next()) return std::nullopt;
    out = ReadBooking(st.get());
  }
  out->table_ids = ReadClaims(db, id);
  return out;
}

std::vector<model::BookingRecord> SqliteRepository::ListBookings(Transaction& t, const std::string& restaurant_id,
                                                                 const std::string& date) {
  auto* db = TX(t).Handle();

  std::vector<model::BookingRecord> out;
  {
    Statement st(db, sql::SELECT_BOOKINGS_FOR_DATE);
    BindText(st.get(), 1, restaurant_id);
    BindText(st.get(), 2, date);
    while (st.Next()) out.push_back(ReadBooking(st.get()));
  }
  for (auto& booking : out) booking.table_ids = ReadClaims(db, booking.id);
  return out;
}

} // namespace tablebook::db::sqlite

#include "pg_repository.hpp"

#include <sstream>

#include "internal/model/booking_state.hpp"
#include "internal/util/errors.hpp"

namespace tablebook::db::postgres {

namespace {

// Reads surface backend failures as StorageError rather than "absent".
template <typename Fn>
auto Read(Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const util::StorageError&) {
    throw;
  } catch (const std::exception& e) {
    auto result = PgRepository::Translate(e);
    throw util::StorageError(result.code, result.message);
  }
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

model::BookingRecord ReadBooking(const pqxx::row& row) {
  model::BookingRecord r;
  r.id                = row[0].c_str();
  r.restaurant_id     = row[1].c_str();
  r.date              = row[2].c_str();
  r.start_minute      = row[3].as<int32_t>();
  r.duration_minutes  = row[4].as<uint32_t>();
  r.party_size        = row[5].as<uint32_t>();
  r.status            = (tablebook::core::v1::BookingStatus)row[6].as<int>();
  r.source            = (tablebook::core::v1::BookingSource)row[7].as<int>();
  r.customer_name     = row[8].c_str();
  r.customer_email    = row[9].c_str();
  r.customer_phone    = row[10].c_str();
  r.notes             = row[11].c_str();
  r.pacing_overridden = row[12].as<bool>();
  r.override_reason   = row[13].c_str();
  r.created_by        = row[14].c_str();
  r.confirmation_code = row[15].c_str();
  r.created_at_ms     = row[16].as<uint64_t>();
  r.updated_at_ms     = row[17].as<uint64_t>();
  r.version           = row[18].as<uint64_t>();
  return r;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

std::unique_ptr<db::Transaction> PgRepository::BeginBounded(std::chrono::milliseconds budget) {
  return std::make_unique<PgTransaction>(pool_, budget);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::ConnectionLost, e.what());
  }

  const auto* sql = dynamic_cast<const pqxx::sql_error*>(&e);
  if (!sql) return Result::Err(ErrorCode::InternalError, e.what());

  const std::string state = sql->sqlstate();
  if (state == "40001") return Result::Err(ErrorCode::SerializationFailure, e.what());
  if (state == "40P01" || state == "55P03") return Result::Err(ErrorCode::Busy, e.what());
  if (state == "23505") return Result::Err(ErrorCode::AlreadyExists, e.what());
  if (state == "23P01" || state == "23503") return Result::Err(ErrorCode::ConstraintViolation, e.what());
  if (state == "42P01") return Result::Err(ErrorCode::UndefinedTable, e.what());
  if (state == "42703") return Result::Err(ErrorCode::UndefinedColumn, e.what());
  if (state == "42601") return Result::Err(ErrorCode::SyntaxError, e.what());
  if (state == "57014") return Result::Err(ErrorCode::Timeout, e.what());
  if (state.rfind("08", 0) == 0) return Result::Err(ErrorCode::ConnectionLost, e.what());
  return Result::Err(ErrorCode::InternalError, e.what());
}

Result PgRepository::UpsertRestaurant(Transaction& t, const model::RestaurantRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_restaurant", r.id, r.name, r.definition_json, r.updated_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::RestaurantRecord> PgRepository::GetRestaurant(Transaction& t, const std::string& id) {
  return Read([&]() -> std::optional<model::RestaurantRecord> {
    auto res = TX(t).Work().exec_prepared("get_restaurant", id);
    if (res.empty()) return std::nullopt;

    model::RestaurantRecord r;
    r.id              = res[0][0].c_str();
    r.name            = res[0][1].c_str();
    r.definition_json = res[0][2].c_str();
    r.updated_at_ms   = res[0][3].as<uint64_t>();
    return r;
  });
}

Result PgRepository::UpsertTable(Transaction& t, const model::TableRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_table", r.id, r.restaurant_id, r.number, r.min_capacity, r.max_capacity,
                               r.combinable, r.active, r.priority, r.section, JoinIds(r.adjacent_table_ids));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeactivateTable(Transaction& t, const std::string& id) {
  try {
    auto res = TX(t).Work().exec_prepared("deactivate_table", id);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "table " + id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::TableRecord> PgRepository::ListTables(Transaction& t, const std::string& restaurant_id) {
  return Read([&] {
    auto res = TX(t).Work().exec_prepared("list_tables", restaurant_id);

    std::vector<model::TableRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) {
      model::TableRecord r;
      r.id                 = row[0].c_str();
      r.restaurant_id      = row[1].c_str();
      r.number             = row[2].c_str();
      r.min_capacity       = row[3].as<uint32_t>();
      r.max_capacity       = row[4].as<uint32_t>();
      r.combinable         = row[5].as<bool>();
      r.active             = row[6].as<bool>();
      r.priority           = row[7].as<int32_t>();
      r.section            = row[8].c_str();
      r.adjacent_table_ids = SplitIds(row[9].c_str());
      out.push_back(std::move(r));
    }
    return out;
  });
}

Result PgRepository::UpsertTurnTimeRule(Transaction& t, const model::TurnTimeRuleRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_turn_time_rule", r.id, r.restaurant_id, r.name, r.min_party_size,
                               r.max_party_size, r.duration_minutes, r.priority, r.active);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::TurnTimeRuleRecord> PgRepository::ListTurnTimeRules(Transaction& t, const std::string& restaurant_id) {
  return Read([&] {
    auto res = TX(t).Work().exec_prepared("list_turn_time_rules", restaurant_id);

    std::vector<model::TurnTimeRuleRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) {
      model::TurnTimeRuleRecord r;
      r.id               = row[0].c_str();
      r.restaurant_id    = row[1].c_str();
      r.name             = row[2].c_str();
      r.min_party_size   = row[3].as<uint32_t>();
      r.max_party_size   = row[4].as<uint32_t>();
      r.duration_minutes = row[5].as<uint32_t>();
      r.priority         = row[6].as<int32_t>();
      r.active           = row[7].as<bool>();
      out.push_back(std::move(r));
    }
    return out;
  });
}

Result PgRepository::WriteClaims(pqxx::work& w, const model::BookingRecord& r) {
  w.exec_prepared("delete_booking_tables", r.id);

  const bool occupying = tablebook::model::OccupiesTable(r.status);
  for (size_t i = 0; i < r.table_ids.size(); ++i) {
    w.exec_prepared("insert_booking_table", r.id, r.table_ids[i], static_cast<int>(i), r.date, r.start_minute,
                    r.start_minute + static_cast<int32_t>(r.duration_minutes), occupying);
  }
  return Result::Ok();
}

std::vector<std::string> PgRepository::ReadClaims(pqxx::work& w, const std::string& booking_id) {
  auto res = w.exec_prepared("list_booking_tables", booking_id);

  std::vector<std::string> out;
  out.reserve(res.size());
  for (const auto& row : res) out.emplace_back(row[0].c_str());
  return out;
}

Result PgRepository::InsertBooking(Transaction& t, const model::BookingRecord& r) {
  try {
    auto& w = TX(t).Work();
    w.exec_prepared("insert_booking", r.id, r.restaurant_id, r.date, r.start_minute, r.duration_minutes,
                    r.party_size, static_cast<int>(r.status), static_cast<int>(r.source), r.customer_name,
                    r.customer_email, r.customer_phone, r.notes, r.pacing_overridden, r.override_reason,
                    r.created_by, r.confirmation_code, r.created_at_ms, r.updated_at_ms, r.version);
    return WriteClaims(w, r);
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpdateBooking(Transaction& t, const model::BookingRecord& r) {
  try {
    auto& w   = TX(t).Work();
    auto  res = w.exec_prepared("update_booking", r.id, r.date, r.start_minute, r.duration_minutes, r.party_size,
                                static_cast<int>(r.status), static_cast<int>(r.source), r.customer_name,
                                r.customer_email, r.customer_phone, r.notes, r.pacing_overridden, r.override_reason,
                                r.updated_at_ms, r.version, r.version - 1);
    if (res.affected_rows() == 0) {
      if (w.exec_prepared("booking_exists", r.id).empty()) {
        return Result::Err(ErrorCode::NotFound, "booking " + r.id);
      }
      return Result::Err(ErrorCode::Conflict, "booking " + r.id + " version mismatch");
    }
    return WriteClaims(w, r);
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::BookingRecord> PgRepository::GetBooking(Transaction& t, const std::string& id) {
  return Read([&]() -> std::optional<model::BookingRecord> {
    auto& w   = TX(t).Work();
    auto  res = w.exec_prepared("get_booking", id);
    if (res.empty()) return std::nullopt;

    auto r      = ReadBooking(res[0]);
    r.table_ids = ReadClaims(w, id);
    return r;
  });
}

std::vector<model::BookingRecord> PgRepository::ListBookings(Transaction& t, const std::string& restaurant_id,
                                                             const std::string& date) {
  return Read([&] {
    auto& w   = TX(t).Work();
    auto  res = w.exec_prepared("list_bookings", restaurant_id, date);

    std::vector<model::BookingRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) {
      auto r      = ReadBooking(row);
      r.table_ids = ReadClaims(w, r.id);
      out.push_back(std::move(r));
    }
    return out;
  });
}

}

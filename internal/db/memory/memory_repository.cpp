#include "memory_repository.hpp"

#include <algorithm>

#include "internal/model/booking_state.hpp"
#include "internal/model/interval.hpp"
#include "memory_tx.hpp"

namespace tablebook::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

bool MemoryRepository::HasOverlappingClaim(const std::unordered_map<std::string, model::BookingRecord>& bookings,
                                           const model::BookingRecord& candidate) {
  if (!tablebook::model::OccupiesTable(candidate.status)) return false;

  const auto window = tablebook::model::MakeInterval(candidate.start_minute, static_cast<int>(candidate.duration_minutes));
  for (const auto& [id, other] : bookings) {
    if (id == candidate.id || other.restaurant_id != candidate.restaurant_id || other.date != candidate.date) continue;
    if (!tablebook::model::OccupiesTable(other.status)) continue;

    const auto other_window = tablebook::model::MakeInterval(other.start_minute, static_cast<int>(other.duration_minutes));
    if (!window.Overlaps(other_window)) continue;

    for (const auto& table_id : candidate.table_ids) {
      if (std::find(other.table_ids.begin(), other.table_ids.end(), table_id) != other.table_ids.end()) return true;
    }
  }
  return false;
}

// ------------------------------------------------------------------
// Restaurants
// ------------------------------------------------------------------

Result MemoryRepository::UpsertRestaurant(Transaction& t, const model::RestaurantRecord& r) {
  auto& tx = TX(t);
  tx.TouchRestaurant(r.id);
  tx.Mutable().restaurants[r.id] = r;
  return Result::Ok();
}

std::optional<model::RestaurantRecord> MemoryRepository::GetRestaurant(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.restaurants.find(id);
  if (it == s.restaurants.end()) return std::nullopt;
  return it->second;
}

// ------------------------------------------------------------------
// Tables
// ------------------------------------------------------------------

Result MemoryRepository::UpsertTable(Transaction& t, const model::TableRecord& r) {
  auto& tx = TX(t);
  tx.TouchTable(r.id);
  tx.Mutable().tables[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::DeactivateTable(Transaction& t, const std::string& id) {
  auto& tx = TX(t);
  auto  it = tx.Mutable().tables.find(id);
  if (it == tx.Mutable().tables.end()) return Result::Err(ErrorCode::NotFound, "table " + id);
  tx.TouchTable(id);
  it->second.active = false;
  return Result::Ok();
}

std::vector<model::TableRecord> MemoryRepository::ListTables(Transaction& t, const std::string& restaurant_id) {
  std::vector<model::TableRecord> out;
  for (const auto& [_, table] : TX(t).View().tables)
    if (table.restaurant_id == restaurant_id) out.push_back(table);

  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.id < b.id; });
  return out;
}

// ------------------------------------------------------------------
// Turn-time rules
// ------------------------------------------------------------------

Result MemoryRepository::UpsertTurnTimeRule(Transaction& t, const model::TurnTimeRuleRecord& r) {
  auto& tx = TX(t);
  tx.TouchTurnTimeRule(r.id);
  tx.Mutable().turn_time_rules[r.id] = r;
  return Result::Ok();
}

std::vector<model::TurnTimeRuleRecord> MemoryRepository::ListTurnTimeRules(Transaction& t, const std::string& restaurant_id) {
  std::vector<model::TurnTimeRuleRecord> out;
  for (const auto& [_, rule] : TX(t).View().turn_time_rules)
    if (rule.restaurant_id == restaurant_id) out.push_back(rule);

  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.id < b.id; });
  return out;
}

// ------------------------------------------------------------------
// Bookings
// ------------------------------------------------------------------

Result MemoryRepository::InsertBooking(Transaction& t, const model::BookingRecord& r) {
  auto& tx = TX(t);
  auto& s  = tx.Mutable();
  if (s.bookings.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "booking " + r.id);
  if (HasOverlappingClaim(s.bookings, r)) {
    return Result::Err(ErrorCode::ConstraintViolation, "booking " + r.id + " overlaps an existing table claim");
  }

  tx.TouchBooking(r.id);
  s.bookings[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::UpdateBooking(Transaction& t, const model::BookingRecord& r) {
  auto& tx = TX(t);
  auto& s  = tx.Mutable();
  auto  it = s.bookings.find(r.id);
  if (it == s.bookings.end()) return Result::Err(ErrorCode::NotFound, "booking " + r.id);
  if (it->second.version + 1 != r.version) {
    return Result::Err(ErrorCode::Conflict, "booking " + r.id + " version mismatch");
  }
  if (HasOverlappingClaim(s.bookings, r)) {
    return Result::Err(ErrorCode::ConstraintViolation, "booking " + r.id + " overlaps an existing table claim");
  }

  tx.TouchBooking(r.id);
  it->second = r;
  return Result::Ok();
}

std::optional<model::BookingRecord> MemoryRepository::GetBooking(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.bookings.find(id);
  if (it == s.bookings.end()) return std::nullopt;
  return it->second;
}

std::vector<model::BookingRecord> MemoryRepository::ListBookings(Transaction& t, const std::string& restaurant_id,
                                                                 const std::string& date) {
  std::vector<model::BookingRecord> out;
  for (const auto& [_, booking] : TX(t).View().bookings)
    if (booking.restaurant_id == restaurant_id && booking.date == date) out.push_back(booking);

  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    if (a.start_minute != b.start_minute) return a.start_minute < b.start_minute;
    return a.id < b.id;
  });
  return out;
}

} // namespace tablebook::db::memory

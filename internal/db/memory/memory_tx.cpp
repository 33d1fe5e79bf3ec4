#include "memory_tx.hpp"

#include "internal/util/errors.hpp"

namespace tablebook::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  working_          = repo_.committed_; // snapshot copy
  snapshot_version_ = repo_.committed_version_;
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::TouchBooking(const std::string& id) {
  if (dirty_bookings_.contains(id)) return;
  auto it = working_.bookings.find(id);
  dirty_bookings_[id] = it == working_.bookings.end() ? 0 : it->second.version;
}

void MemoryTransaction::Commit() {
  if (committed_ || rolled_back_) {
    throw util::StorageError(ErrorCode::InternalError, "memory commit: transaction already finished");
  }

  std::scoped_lock lock(repo_.mutex_);
  auto& committed = repo_.committed_;

  if (repo_.committed_version_ != snapshot_version_) {
    for (const auto& [id, seen_version] : dirty_bookings_) {
      auto current = committed.bookings.find(id);
      const uint64_t current_version = current == committed.bookings.end() ? 0 : current->second.version;
      if (current_version != seen_version) {
        throw util::StorageError(ErrorCode::SerializationFailure, "memory commit: booking " + id + " was modified concurrently");
      }
    }

    // claims committed by others since our snapshot
    auto merged = committed.bookings;
    for (const auto& [id, _] : dirty_bookings_) {
      merged[id] = working_.bookings.at(id);
    }
    for (const auto& [id, _] : dirty_bookings_) {
      auto others = merged;
      others.erase(id);
      if (MemoryRepository::HasOverlappingClaim(others, working_.bookings.at(id))) {
        throw util::StorageError(ErrorCode::ConstraintViolation, "memory commit: booking " + id + " overlaps a committed table claim");
      }
    }
  }

  for (const auto& id : dirty_restaurants_) committed.restaurants[id] = working_.restaurants.at(id);
  for (const auto& id : dirty_tables_) committed.tables[id] = working_.tables.at(id);
  for (const auto& id : dirty_rules_) committed.turn_time_rules[id] = working_.turn_time_rules.at(id);
  for (const auto& [id, _] : dirty_bookings_) committed.bookings[id] = working_.bookings.at(id);

  repo_.committed_version_++;
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  rolled_back_ = true;
}

} // namespace tablebook::db::memory

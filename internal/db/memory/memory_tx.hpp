#pragma once

#include <string>
#include <unordered_map>
#include <unordered_set>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace tablebook::db::memory {

/*
  Transaction = snapshot + write set

  Commit re-checks the write set against whatever committed since the
  snapshot was taken:
    - a booking updated underneath us   -> SerializationFailure
    - a new overlapping table claim     -> ConstraintViolation
  Disjoint writers both commit.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  const MemoryRepository::State& View() const {
    return working_;
  }

  MemoryRepository::State& Mutable() {
    return working_;
  }

  void TouchRestaurant(const std::string& id) { dirty_restaurants_.insert(id); }
  void TouchTable(const std::string& id) { dirty_tables_.insert(id); }
  void TouchTurnTimeRule(const std::string& id) { dirty_rules_.insert(id); }

  // Must be called before the booking is modified in the working state.
  void TouchBooking(const std::string& id);

 private:
  MemoryRepository&       repo_;
  MemoryRepository::State working_;
  uint64_t                snapshot_version_ = 0;
  bool                    committed_        = false;
  bool                    rolled_back_      = false;

  std::unordered_set<std::string> dirty_restaurants_;
  std::unordered_set<std::string> dirty_tables_;
  std::unordered_set<std::string> dirty_rules_;

  // booking id -> version seen in the snapshot (0 = did not exist)
  std::unordered_map<std::string, uint64_t> dirty_bookings_;
};

} // namespace tablebook::db::memory

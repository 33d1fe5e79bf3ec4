#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/model/booking_record.hpp"
#include "tablebook/v1.hpp"

namespace tablebook::core {

struct AssignmentRequest {
  int      start_minute     = 0;
  uint32_t duration_minutes = 0;
  uint32_t party_size       = 0;

  // Booking being modified; its own claims do not block it.
  std::string exclude_booking_id;

  // Caller-chosen table. When set, only this table is considered.
  std::string requested_table_id;
};

// One table, or several adjoining tables pushed together.
struct Assignment {
  std::vector<tablebook::v1::Table> tables;

  bool Combined() const {
    return tables.size() > 1;
  }

  std::vector<std::string> TableIds() const;
};

struct TableAvailability {
  // Free single tables that fit the party, best first.
  std::vector<tablebook::v1::Table> candidates;

  // Best combination; only computed when no single table is free.
  std::vector<tablebook::v1::Table> combination;

  std::optional<Assignment> best;

  // Single candidates, or 1 when only a combination fits.
  uint32_t tables_available = 0;

  uint32_t active_tables   = 0;
  uint32_t occupied_tables = 0;
};

/*
  Finds free tables for a requested interval.

  A table is a candidate when it is active, min_capacity <= party <=
  max_capacity, and no occupying booking (any status but CANCELLED)
  claims it over an overlapping [start, start+duration). Candidates are
  ordered by tightest fit (max_capacity - party), then higher priority,
  then lower id.

  When no single table fits and combinations are allowed, connected
  groups (adjacency is symmetric) of free combinable tables of up to
  max_combination_size are considered: summed max_capacity must cover
  the party and no member's min_capacity may exceed it. Fewest tables
  wins, then least spare capacity, then highest summed priority, then
  lowest ids.
*/
class TableAssignmentResolver {
 public:
  static constexpr uint32_t kDefaultMaxCombinationSize = 3;

  TableAssignmentResolver(bool allow_combinations = false, uint32_t max_combination_size = kDefaultMaxCombinationSize);

  static TableAssignmentResolver ForRestaurant(const tablebook::v1::Restaurant& restaurant);

  TableAvailability FindAvailableTables(const std::vector<tablebook::v1::Table>&        tables,
                                        const std::vector<db::model::BookingRecord>& bookings,
                                        const AssignmentRequest&                      request) const;

  std::optional<Assignment> FindBestTable(const std::vector<tablebook::v1::Table>&        tables,
                                          const std::vector<db::model::BookingRecord>& bookings,
                                          const AssignmentRequest&                      request) const;

 private:
  std::vector<tablebook::v1::Table> BestCombination(const std::vector<tablebook::v1::Table>& pool, uint32_t party_size) const;

  bool     allow_combinations_;
  uint32_t max_combination_size_;
};

} // namespace tablebook::core

#include "table_assignment_resolver.hpp"

#include <algorithm>
#include <functional>
#include <tuple>
#include <unordered_map>
#include <unordered_set>

#include "internal/model/booking_state.hpp"
#include "internal/model/interval.hpp"

namespace tablebook::core {

using namespace tablebook::v1;

namespace {

bool Fits(const Table& table, uint32_t party_size) {
  return table.min_capacity() <= party_size && party_size <= table.max_capacity();
}

// Ids of tables claimed by an occupying booking over `window`.
std::unordered_set<std::string> BusyTables(const std::vector<db::model::BookingRecord>& bookings,
                                           const tablebook::model::Interval& window, const std::string& exclude_booking_id) {
  std::unordered_set<std::string> busy;
  for (const auto& booking : bookings) {
    if (!tablebook::model::OccupiesTable(booking.status)) continue;
    if (!exclude_booking_id.empty() && booking.id == exclude_booking_id) continue;

    const auto claimed = tablebook::model::MakeInterval(booking.start_minute, static_cast<int>(booking.duration_minutes));
    if (!claimed.Overlaps(window)) continue;

    busy.insert(booking.table_ids.begin(), booking.table_ids.end());
  }
  return busy;
}

bool BetterSingle(const Table& a, const Table& b, uint32_t party_size) {
  const auto waste_a = a.max_capacity() - party_size;
  const auto waste_b = b.max_capacity() - party_size;
  if (waste_a != waste_b) return waste_a < waste_b;
  if (a.priority() != b.priority()) return a.priority() > b.priority();
  return a.id() < b.id();
}

} // namespace

std::vector<std::string> Assignment::TableIds() const {
  std::vector<std::string> ids;
  ids.reserve(tables.size());
  for (const auto& table : tables) ids.push_back(table.id());
  return ids;
}

TableAssignmentResolver::TableAssignmentResolver(bool allow_combinations, uint32_t max_combination_size)
    : allow_combinations_(allow_combinations),
      max_combination_size_(max_combination_size > 0 ? max_combination_size : kDefaultMaxCombinationSize) {
}

TableAssignmentResolver TableAssignmentResolver::ForRestaurant(const Restaurant& restaurant) {
  return TableAssignmentResolver(restaurant.settings().allow_table_combinations(), restaurant.settings().max_combination_size());
}

TableAvailability TableAssignmentResolver::FindAvailableTables(const std::vector<Table>&                      tables,
                                                               const std::vector<db::model::BookingRecord>& bookings,
                                                               const AssignmentRequest&                      request) const {
  TableAvailability out;

  const auto window = tablebook::model::MakeInterval(request.start_minute, static_cast<int>(request.duration_minutes));
  const auto busy   = BusyTables(bookings, window, request.exclude_booking_id);

  std::vector<Table> pool;
  for (const auto& table : tables) {
    if (!table.active()) continue;
    ++out.active_tables;

    if (busy.count(table.id())) {
      ++out.occupied_tables;
      continue;
    }
    if (!request.requested_table_id.empty() && table.id() != request.requested_table_id) continue;

    if (Fits(table, request.party_size)) out.candidates.push_back(table);
    if (table.combinable()) pool.push_back(table);
  }

  std::sort(out.candidates.begin(), out.candidates.end(),
            [&](const Table& a, const Table& b) { return BetterSingle(a, b, request.party_size); });

  if (!out.candidates.empty()) {
    out.tables_available = static_cast<uint32_t>(out.candidates.size());
    out.best             = Assignment{{out.candidates.front()}};
    return out;
  }

  if (allow_combinations_ && request.requested_table_id.empty()) {
    out.combination = BestCombination(pool, request.party_size);
    if (!out.combination.empty()) {
      out.tables_available = 1;
      out.best             = Assignment{out.combination};
    }
  }
  return out;
}

std::optional<Assignment> TableAssignmentResolver::FindBestTable(const std::vector<Table>&                      tables,
                                                                 const std::vector<db::model::BookingRecord>& bookings,
                                                                 const AssignmentRequest&                      request) const {
  return FindAvailableTables(tables, bookings, request).best;
}

std::vector<Table> TableAssignmentResolver::BestCombination(const std::vector<Table>& pool_in, uint32_t party_size) const {
  if (pool_in.size() < 2) return {};

  std::vector<Table> pool = pool_in;
  std::sort(pool.begin(), pool.end(), [](const Table& a, const Table& b) { return a.id() < b.id(); });

  std::unordered_map<std::string, size_t> index;
  for (size_t i = 0; i < pool.size(); ++i) index.emplace(pool[i].id(), i);

  // symmetric adjacency restricted to the pool
  std::vector<std::vector<bool>> adjacent(pool.size(), std::vector<bool>(pool.size(), false));
  for (size_t i = 0; i < pool.size(); ++i) {
    for (const auto& other : pool[i].adjacent_table_ids()) {
      auto it = index.find(other);
      if (it == index.end() || it->second == i) continue;
      adjacent[i][it->second] = true;
      adjacent[it->second][i] = true;
    }
  }

  auto connected = [&](const std::vector<size_t>& members) {
    std::vector<bool>   seen(members.size(), false);
    std::vector<size_t> stack{0};
    seen[0]            = true;
    size_t reached     = 1;
    while (!stack.empty()) {
      const auto at = stack.back();
      stack.pop_back();
      for (size_t j = 0; j < members.size(); ++j) {
        if (!seen[j] && adjacent[members[at]][members[j]]) {
          seen[j] = true;
          ++reached;
          stack.push_back(j);
        }
      }
    }
    return reached == members.size();
  };

  using Rank = std::tuple<uint64_t, int64_t, std::vector<std::string>>;
  std::optional<Rank>    best_rank;
  std::vector<size_t>    best_members;
  std::vector<size_t>    members;

  const size_t max_size = std::min<size_t>(max_combination_size_, pool.size());
  for (size_t k = 2; k <= max_size && best_members.empty(); ++k) {
    std::function<void(size_t)> choose = [&](size_t from) {
      if (members.size() == k) {
        uint64_t total_max = 0;
        uint32_t max_min   = 0;
        int64_t  priority  = 0;
        for (auto m : members) {
          total_max += pool[m].max_capacity();
          max_min = std::max(max_min, pool[m].min_capacity());
          priority += pool[m].priority();
        }
        if (total_max < party_size || max_min > party_size || !connected(members)) return;

        std::vector<std::string> ids;
        for (auto m : members) ids.push_back(pool[m].id());
        Rank rank{total_max - party_size, -priority, std::move(ids)};
        if (!best_rank || rank < *best_rank) {
          best_rank    = std::move(rank);
          best_members = members;
        }
        return;
      }
      for (size_t i = from; i < pool.size(); ++i) {
        members.push_back(i);
        choose(i + 1);
        members.pop_back();
      }
    };
    choose(0);
  }

  std::vector<Table> out;
  for (auto m : best_members) out.push_back(pool[m]);
  return out;
}

} // namespace tablebook::core

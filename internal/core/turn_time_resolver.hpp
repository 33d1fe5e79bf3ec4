#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "tablebook/v1.hpp"

namespace tablebook::core {

/*
  Maps (restaurant, party size) to the expected table occupancy.

  Among active rules whose [min_party_size, max_party_size] contains the
  party, the winner is: highest priority, then narrowest range, then
  lowest minimum, then lowest id. With no match the default applies.
  Resolution never throws; storage failures fall back to the default.
*/
class TurnTimeResolver {
 public:
  static constexpr uint32_t kDefaultTurnTimeMinutes = 120;

  explicit TurnTimeResolver(std::shared_ptr<db::Repository> repository,
                            uint32_t                        default_minutes = kDefaultTurnTimeMinutes);

  uint32_t ResolveDuration(const std::string& restaurant_id, uint32_t party_size) const;

  // Same, reading rules through an existing transaction.
  uint32_t ResolveDuration(db::Transaction& tx, const std::string& restaurant_id, uint32_t party_size) const;

  static uint32_t Select(const std::vector<tablebook::v1::TurnTimeRule>& rules, uint32_t party_size,
                         uint32_t default_minutes);

  uint32_t DefaultMinutes() const {
    return default_minutes_;
  }

 private:
  std::shared_ptr<db::Repository> repository_;
  uint32_t                        default_minutes_;
};

} // namespace tablebook::core

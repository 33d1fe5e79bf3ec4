#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "internal/core/slot_grid_generator.hpp"
#include "internal/core/turn_time_resolver.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"
#include "tablebook/v1.hpp"

namespace tablebook::core {

struct ReporterOptions {
  uint32_t default_interval_minutes = SlotGridGenerator::kDefaultIntervalMinutes;
  uint32_t max_alternatives         = 4;
  uint32_t max_suggestions          = 5;
  // Hard cap; a restaurant may configure a lower max_party_size.
  uint32_t max_party_size           = 50;
};

/*
  Day-wide availability for one party size.

  Reads one snapshot, then for every slot of the grid resolves table
  availability and pacing. A slot that fails to evaluate carries the
  error and is counted in failed_slots; the rest of the report stands.
  Read-only and lock-free.
*/
class AvailabilityReporter {
 public:
  using ClockFn = std::function<util::TimePoint()>;

  AvailabilityReporter(std::shared_ptr<db::Repository> repository, std::shared_ptr<TurnTimeResolver> turn_times,
                       ReporterOptions options = {}, ClockFn clock = util::Now);

  tablebook::v1::GetAvailabilityResponse Report(const tablebook::v1::GetAvailabilityRequest& request) const;

  tablebook::v1::GetAvailableTablesResponse AvailableTables(const tablebook::v1::GetAvailableTablesRequest& request) const;

  // Bookable (AVAILABLE / MODERATE) slot times nearest to `minute`,
  // excluding `minute` itself; the earlier slot wins a tie.
  static std::vector<std::string> NearestBookable(const std::vector<tablebook::v1::AvailabilitySlot>& slots, int minute,
                                                  uint32_t max_results);

  static void Suggest(const std::vector<tablebook::v1::AvailabilitySlot>& slots, uint32_t max_results,
                      tablebook::v1::AvailabilitySuggestions* out);

 private:
  std::shared_ptr<db::Repository>   repository_;
  std::shared_ptr<TurnTimeResolver> turn_times_;
  ReporterOptions                   options_;
  ClockFn                           clock_;
  SlotGridGenerator                 grid_;
};

} // namespace tablebook::core

#include "availability_reporter.hpp"

#include <algorithm>
#include <cstdlib>

#include "internal/core/pacing_classifier.hpp"
#include "internal/core/records.hpp"
#include "internal/core/table_assignment_resolver.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace tablebook::core {

using namespace tablebook::v1;

namespace {

bool IsBookable(const AvailabilitySlot& slot) {
  return slot.error().empty() && (slot.status() == PACING_STATUS_AVAILABLE || slot.status() == PACING_STATUS_MODERATE);
}

int SlotMinute(const AvailabilitySlot& slot) {
  return util::ParseTimeOfDay(slot.time()).value_or(0);
}

Restaurant LoadRestaurant(db::Repository& repository, db::Transaction& tx, const std::string& restaurant_id) {
  auto record = repository.GetRestaurant(tx, restaurant_id);
  if (!record) throw util::NotFound("restaurant not found: " + restaurant_id);
  return ToRestaurant(*record);
}

void ValidatePartySize(uint32_t party_size, const Restaurant& restaurant, uint32_t cap) {
  uint32_t max_party = cap;
  if (restaurant.settings().max_party_size() > 0) max_party = std::min(max_party, restaurant.settings().max_party_size());
  if (party_size < 1 || party_size > max_party) {
    throw util::InvalidArgument("party size must be between 1 and " + std::to_string(max_party), "PARTY_SIZE");
  }
}

util::Date RequireDate(const std::string& text) {
  auto date = util::ParseDate(text);
  if (!date) throw util::InvalidArgument("date must be YYYY-MM-DD: '" + text + "'", "DATE_FORMAT");
  return *date;
}

} // namespace

AvailabilityReporter::AvailabilityReporter(std::shared_ptr<db::Repository> repository, std::shared_ptr<TurnTimeResolver> turn_times,
                                           ReporterOptions options, ClockFn clock)
    : repository_(std::move(repository)), turn_times_(std::move(turn_times)), options_(options), clock_(std::move(clock)) {
}

std::vector<std::string> AvailabilityReporter::NearestBookable(const std::vector<AvailabilitySlot>& slots, int minute,
                                                               uint32_t max_results) {
  std::vector<std::pair<int, int>> ranked; // (distance, slot minute)
  for (const auto& slot : slots) {
    if (!IsBookable(slot)) continue;
    const int at = SlotMinute(slot);
    if (at == minute) continue;
    ranked.emplace_back(std::abs(at - minute), at);
  }
  std::sort(ranked.begin(), ranked.end());

  std::vector<std::string> out;
  for (const auto& [distance, at] : ranked) {
    if (out.size() >= max_results) break;
    out.push_back(util::FormatTimeOfDay(at));
  }
  return out;
}

void AvailabilityReporter::Suggest(const std::vector<AvailabilitySlot>& slots, uint32_t max_results, AvailabilitySuggestions* out) {
  std::vector<const AvailabilitySlot*> bookable;
  for (const auto& slot : slots) {
    if (!slot.error().empty()) continue;

    switch (slot.status()) {
      case PACING_STATUS_AVAILABLE:
        if (static_cast<uint32_t>(out->quiet_times_size()) < max_results) out->add_quiet_times(slot.time());
        bookable.push_back(&slot);
        break;
      case PACING_STATUS_MODERATE:
        bookable.push_back(&slot);
        break;
      case PACING_STATUS_BUSY:
        bookable.push_back(&slot);
        if (static_cast<uint32_t>(out->peak_times_size()) < max_results) out->add_peak_times(slot.time());
        break;
      case PACING_STATUS_PACING_FULL:
        if (static_cast<uint32_t>(out->peak_times_size()) < max_results) out->add_peak_times(slot.time());
        break;
      default:
        break;
    }
  }

  std::stable_sort(bookable.begin(), bookable.end(), [](const AvailabilitySlot* a, const AvailabilitySlot* b) {
    if (a->utilization_percent() != b->utilization_percent()) return a->utilization_percent() < b->utilization_percent();
    if (a->tables_available() != b->tables_available()) return a->tables_available() > b->tables_available();
    return SlotMinute(*a) < SlotMinute(*b);
  });
  for (size_t i = 0; i < bookable.size() && i < max_results; ++i) out->add_best_availability(bookable[i]->time());
}

GetAvailabilityResponse AvailabilityReporter::Report(const GetAvailabilityRequest& request) const {
  const auto date = RequireDate(request.date());

  std::optional<int> preferred;
  if (!request.preferred_time().empty()) {
    preferred = util::ParseTimeOfDay(request.preferred_time());
    if (!preferred) throw util::InvalidArgument("time must be HH:MM: '" + request.preferred_time() + "'", "TIME_FORMAT");
  }

  auto       tx         = repository_->BeginRead();
  const auto restaurant = LoadRestaurant(*repository_, *tx, request.restaurant_id());
  ValidatePartySize(request.party_size(), restaurant, options_.max_party_size);

  const auto grid = grid_.Generate(restaurant, date, options_.default_interval_minutes);
  if (!grid.open) {
    throw util::RestaurantClosed("restaurant " + restaurant.id() + " is closed on " + request.date());
  }

  const auto& settings = restaurant.settings();
  const auto  now      = util::ToLocal(clock_(), settings.utc_offset_minutes());
  if (date < now.date) {
    throw util::InvalidArgument("cannot report availability for a past date", "PAST_DATE");
  }
  if (settings.max_advance_days() > 0 &&
      std::chrono::sys_days(date) - std::chrono::sys_days(now.date) > std::chrono::days(settings.max_advance_days())) {
    throw util::InvalidArgument("date is more than " + std::to_string(settings.max_advance_days()) + " days ahead",
                                "TOO_FAR_AHEAD");
  }
  const auto earliest = util::ToInstant(now.date, now.minute_of_day, settings.utc_offset_minutes()) +
                        std::chrono::minutes(settings.min_advance_minutes());

  const uint32_t duration = request.duration_minutes() > 0
                                ? request.duration_minutes()
                                : turn_times_->ResolveDuration(*tx, restaurant.id(), request.party_size());

  const auto tables   = ToTables(repository_->ListTables(*tx, restaurant.id()));
  const auto bookings = repository_->ListBookings(*tx, restaurant.id(), request.date());
  const auto resolver = TableAssignmentResolver::ForRestaurant(restaurant);

  GetAvailabilityResponse response;
  response.set_restaurant_id(restaurant.id());
  response.set_date(request.date());
  response.set_party_size(request.party_size());
  response.set_duration_minutes(duration);

  std::vector<AvailabilitySlot> slots;
  uint32_t                      failed = 0;
  for (const auto& slot : grid.slots) {
    if (util::ToInstant(date, slot.minute, settings.utc_offset_minutes()) < earliest) continue;
    // bookings are kept per date, so a seating may not spill into the next day
    if (slot.minute + static_cast<int>(duration) > util::kMinutesPerDay) continue;

    AvailabilitySlot out;
    out.set_time(slot.time);
    out.set_period(slot.period);
    try {
      AssignmentRequest assignment;
      assignment.start_minute     = slot.minute;
      assignment.duration_minutes = duration;
      assignment.party_size       = request.party_size();

      const auto availability = resolver.FindAvailableTables(tables, bookings, assignment);
      const auto load         = PacingClassifier::LoadAt(bookings, slot.minute, slot.interval_minutes);
      const auto pacing       = PacingClassifier::Classify(availability, load, request.party_size(), restaurant.pacing());

      out.set_tables_available(availability.tables_available);
      out.set_status(pacing.status);
      out.set_utilization_percent(pacing.utilization_percent);
      out.set_can_override(pacing.can_override);
      out.set_committed_covers(load.committed_covers);
      out.set_committed_bookings(load.committed_bookings);
      if (availability.best) {
        for (const auto& id : availability.best->TableIds()) out.add_suggested_table_ids(id);
      }
    } catch (const std::exception& e) {
      ++failed;
      out.set_status(PACING_STATUS_UNSPECIFIED);
      out.set_error(e.what());
      TABLEBOOK_LOG_WARN("availability slot failed",
                         {observability::StringField("restaurant_id", restaurant.id()), observability::StringField("date", request.date()),
                          observability::StringField("time", slot.time), observability::StringField("error", e.what())});
    }
    slots.push_back(std::move(out));
  }

  for (auto& slot : slots) {
    if (!slot.error().empty() || IsBookable(slot)) continue;
    for (auto& alt : NearestBookable(slots, SlotMinute(slot), options_.max_alternatives)) slot.add_alternative_times(alt);
  }

  if (preferred) {
    auto it = std::find_if(slots.begin(), slots.end(), [&](const AvailabilitySlot& s) { return SlotMinute(s) == *preferred; });
    if (it == slots.end() || !IsBookable(*it)) {
      for (auto& alt : NearestBookable(slots, *preferred, options_.max_alternatives)) response.add_preferred_time_alternatives(alt);
    }
  }

  Suggest(slots, options_.max_suggestions, response.mutable_suggestions());

  for (auto& slot : slots) *response.add_slots() = std::move(slot);
  response.set_failed_slots(failed);
  return response;
}

GetAvailableTablesResponse AvailabilityReporter::AvailableTables(const GetAvailableTablesRequest& request) const {
  RequireDate(request.date());
  const auto minute = util::ParseTimeOfDay(request.time());
  if (!minute) throw util::InvalidArgument("time must be HH:MM: '" + request.time() + "'", "TIME_FORMAT");

  auto       tx         = repository_->BeginRead();
  const auto restaurant = LoadRestaurant(*repository_, *tx, request.restaurant_id());
  ValidatePartySize(request.party_size(), restaurant, options_.max_party_size);

  const uint32_t duration = request.duration_minutes() > 0
                                ? request.duration_minutes()
                                : turn_times_->ResolveDuration(*tx, restaurant.id(), request.party_size());

  AssignmentRequest assignment;
  assignment.start_minute     = *minute;
  assignment.duration_minutes = duration;
  assignment.party_size       = request.party_size();

  const auto availability = TableAssignmentResolver::ForRestaurant(restaurant).FindAvailableTables(
      ToTables(repository_->ListTables(*tx, restaurant.id())), repository_->ListBookings(*tx, restaurant.id(), request.date()),
      assignment);

  GetAvailableTablesResponse response;
  for (const auto& table : availability.candidates) *response.add_tables() = table;
  if (!availability.candidates.empty()) *response.mutable_suggested_table() = availability.candidates.front();
  for (const auto& table : availability.combination) *response.add_suggested_combination() = table;
  response.set_total_available(availability.tables_available);
  response.set_duration_minutes(duration);
  return response;
}

} // namespace tablebook::core

#include "booking_manager.hpp"

#include <algorithm>

#include "internal/core/pacing_classifier.hpp"
#include "internal/core/records.hpp"
#include "internal/core/table_assignment_resolver.hpp"
#include "internal/model/booking_state.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace tablebook::core {

using namespace tablebook::v1;
using observability::IntField;
using observability::StringField;

struct BookingManager::Target {
  Restaurant  restaurant;
  std::string date;
  std::string time;
  int         minute = 0;
  uint32_t    party_size       = 0;
  uint32_t    duration_minutes = 0;
  int         slot_minute      = 0;
  uint32_t    slot_interval    = 0;
  bool        override_pacing  = false;
  std::string override_reason;
};

namespace {

std::string Trim(const std::string& text) {
  const auto first = text.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) return {};
  const auto last = text.find_last_not_of(" \t\r\n");
  return text.substr(first, last - first + 1);
}

bool Modifiable(BookingStatus status) {
  return status == BOOKING_STATUS_PENDING || status == BOOKING_STATUS_CONFIRMED;
}

BookingSource EffectiveSource(BookingSource source) {
  return source == BOOKING_SOURCE_UNSPECIFIED ? BOOKING_SOURCE_STAFF : source;
}

} // namespace

BookingManager::BookingManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<lock::LockCoordinator> locks,
                               std::shared_ptr<TurnTimeResolver> turn_times, BookingOptions options, ClockFn clock)
    : repository_(std::move(repository)),
      locks_(std::move(locks)),
      turn_times_(std::move(turn_times)),
      options_(options),
      clock_(std::move(clock)) {
}

BookingManager::Target BookingManager::Validate(const std::string& restaurant_id, const std::string& date_text,
                                                const std::string& time_text, uint32_t party_size, uint32_t duration_minutes,
                                                bool override_pacing, const std::string& override_reason, BookingSource source) {
  const auto date = util::ParseDate(date_text);
  if (!date) throw util::InvalidArgument("date must be YYYY-MM-DD: '" + date_text + "'", "DATE_FORMAT");

  const auto minute = util::ParseTimeOfDay(time_text);
  if (!minute) throw util::InvalidArgument("time must be HH:MM: '" + time_text + "'", "TIME_FORMAT");

  if (party_size < 1) throw util::InvalidArgument("party size must be at least 1", "PARTY_SIZE");

  if (duration_minutes != 0 &&
      (duration_minutes < options_.min_duration_minutes || duration_minutes > options_.max_duration_minutes)) {
    throw util::InvalidArgument("duration must be between " + std::to_string(options_.min_duration_minutes) + " and " +
                                    std::to_string(options_.max_duration_minutes) + " minutes",
                                "DURATION");
  }

  Target target;
  target.override_pacing = override_pacing;
  if (override_pacing) {
    const auto src = EffectiveSource(source);
    if (src != BOOKING_SOURCE_STAFF && src != BOOKING_SOURCE_PHONE) {
      throw util::InvalidArgument("pacing overrides are only accepted from staff", "OVERRIDE_NOT_PERMITTED");
    }
    target.override_reason = Trim(override_reason);
    if (target.override_reason.size() < options_.min_override_reason_length) {
      throw util::InvalidArgument("override reason must be at least " + std::to_string(options_.min_override_reason_length) +
                                      " characters",
                                  "OVERRIDE_REASON");
    }
  }

  auto tx     = repository_->BeginRead();
  auto record = repository_->GetRestaurant(*tx, restaurant_id);
  if (!record) throw util::NotFound("restaurant not found: " + restaurant_id);
  target.restaurant = ToRestaurant(*record);

  const auto& settings  = target.restaurant.settings();
  uint32_t    max_party = options_.max_party_size;
  if (settings.max_party_size() > 0) max_party = std::min(max_party, settings.max_party_size());
  if (party_size > max_party) {
    throw util::InvalidArgument("party size exceeds the maximum of " + std::to_string(max_party), "PARTY_TOO_LARGE");
  }

  if (!SlotGridGenerator::DayFor(target.restaurant.schedule(), *date).open()) {
    throw util::RestaurantClosed("restaurant " + restaurant_id + " is closed on " + date_text);
  }

  const auto* period = SlotGridGenerator::PeriodAt(target.restaurant, *date, *minute);
  const int   period_start = period ? util::ParseTimeOfDay(period->start_time()).value_or(0) : 0;
  const int   last_seating = period ? util::ParseTimeOfDay(period->end_time()).value_or(0) -
                                        static_cast<int>(settings.last_seating_offset_minutes())
                                    : 0;
  if (!period || *minute > last_seating) {
    throw util::InvalidArgument(time_text + " is outside service hours", "OUTSIDE_SERVICE_HOURS");
  }

  const auto now      = clock_();
  const auto starts   = util::ToInstant(*date, *minute, settings.utc_offset_minutes());
  if (starts < now + std::chrono::minutes(settings.min_advance_minutes())) {
    throw util::InvalidArgument("bookings need at least " + std::to_string(settings.min_advance_minutes()) + " minutes notice",
                                "TOO_SOON");
  }
  const auto today = util::ToLocal(now, settings.utc_offset_minutes()).date;
  if (settings.max_advance_days() > 0 &&
      std::chrono::sys_days(*date) - std::chrono::sys_days(today) > std::chrono::days(settings.max_advance_days())) {
    throw util::InvalidArgument("bookings open " + std::to_string(settings.max_advance_days()) + " days ahead", "TOO_FAR_AHEAD");
  }

  target.date             = util::FormatDate(*date);
  target.time             = util::FormatTimeOfDay(*minute);
  target.minute           = *minute;
  target.party_size       = party_size;
  target.duration_minutes = duration_minutes > 0 ? duration_minutes : turn_times_->ResolveDuration(*tx, restaurant_id, party_size);
  target.slot_interval    = SlotGridGenerator::IntervalFor(target.restaurant, *period, options_.default_interval_minutes);
  target.slot_minute = period_start + (*minute - period_start) / static_cast<int>(target.slot_interval) * static_cast<int>(target.slot_interval);
  return target;
}

db::model::BookingRecord BookingManager::Place(const Target& target, const db::model::BookingRecord& draft, bool update,
                                               const std::string& requested_table_id, const std::string& preferred_table_id,
                                               std::stop_token stop) {
  const auto& restaurant_id = target.restaurant.id();
  if (target.minute + static_cast<int>(target.duration_minutes) > util::kMinutesPerDay) {
    throw util::InvalidArgument("a " + std::to_string(target.duration_minutes) + " minute seating at " + target.time +
                                    " would run past midnight",
                                "CROSSES_MIDNIGHT");
  }

  // one key per pacing window
  std::vector<std::string> keys{locks_->SlotKey(restaurant_id, target.date, util::FormatTimeOfDay(target.slot_minute))};
  if (!requested_table_id.empty()) keys.push_back(locks_->TableKey(restaurant_id, requested_table_id, target.date));

  return locks_->WithLock(
      std::move(keys),
      [&](lock::LockLease& lease) {
        auto tx = repository_->BeginBounded(lease.Remaining());

        db::model::BookingRecord record = draft;
        if (update) {
          auto stored = repository_->GetBooking(*tx, draft.id);
          if (!stored) throw util::NotFound("booking not found: " + draft.id);
          if (!Modifiable(stored->status)) {
            throw util::InvalidState("booking " + draft.id + " is " + BookingStatus_Name(stored->status) + " and cannot be modified");
          }
          record                  = *stored;
          record.date             = draft.date;
          record.start_minute     = draft.start_minute;
          record.party_size       = draft.party_size;
          record.duration_minutes = draft.duration_minutes;
          record.updated_at_ms    = draft.updated_at_ms;
          record.version          = stored->version + 1;
        }

        const auto tables   = ToTables(repository_->ListTables(*tx, restaurant_id));
        const auto bookings = repository_->ListBookings(*tx, restaurant_id, target.date);
        const auto resolver = TableAssignmentResolver::ForRestaurant(target.restaurant);

        AssignmentRequest request;
        request.start_minute       = target.minute;
        request.duration_minutes   = target.duration_minutes;
        request.party_size         = target.party_size;
        request.exclude_booking_id = update ? record.id : std::string();
        request.requested_table_id = requested_table_id;

        auto availability = resolver.FindAvailableTables(tables, bookings, request);
        if (availability.best && requested_table_id.empty() && !preferred_table_id.empty()) {
          auto keep                  = request;
          keep.requested_table_id    = preferred_table_id;
          if (auto same = resolver.FindBestTable(tables, bookings, keep)) availability.best = std::move(same);
        }
        if (!availability.best) {
          if (!requested_table_id.empty()) {
            throw util::CapacityConflict("table " + requested_table_id + " is not available at " + target.time,
                                         util::ConflictReason::kTableUnavailable);
          }
          throw util::CapacityConflict("no table for " + std::to_string(target.party_size) + " is free at " + target.time);
        }

        const auto load   = PacingClassifier::LoadAt(bookings, target.slot_minute, target.slot_interval, request.exclude_booking_id);
        const auto pacing = PacingClassifier::Classify(availability, load, target.party_size, target.restaurant.pacing());

        record.pacing_overridden = false;
        record.override_reason.clear();
        if (pacing.status == PACING_STATUS_PACING_FULL) {
          if (!target.override_pacing) {
            throw util::OverrideRequired("slot " + target.time + " is at its pacing limit", pacing.utilization_percent);
          }
          record.pacing_overridden = true;
          record.override_reason   = target.override_reason;
        }
        record.table_ids = availability.best->TableIds();

        lease.EnsureHeld();
        util::ThrowIfDbError(update ? repository_->UpdateBooking(*tx, record) : repository_->InsertBooking(*tx, record),
                             update ? "update booking" : "insert booking");
        tx->Commit();
        return record;
      },
      stop);
}

Booking BookingManager::Create(const CreateBookingRequest& request, std::stop_token stop) {
  const auto target = Validate(request.restaurant_id(), request.date(), request.time(), request.party_size(),
                               request.duration_minutes(), request.override_pacing(), request.override_reason(), request.source());

  const uint64_t now = util::ToUnixMillis(clock_());

  db::model::BookingRecord draft;
  draft.id                = util::GenerateId();
  draft.restaurant_id     = target.restaurant.id();
  draft.date              = target.date;
  draft.start_minute      = target.minute;
  draft.duration_minutes  = target.duration_minutes;
  draft.party_size        = target.party_size;
  draft.status            = BOOKING_STATUS_CONFIRMED;
  draft.source            = EffectiveSource(request.source());
  draft.customer_name     = request.customer().name();
  draft.customer_email    = request.customer().email();
  draft.customer_phone    = request.customer().phone();
  draft.notes             = request.notes();
  draft.created_by        = request.created_by();
  draft.confirmation_code = util::GenerateConfirmationCode();
  draft.created_at_ms     = now;
  draft.updated_at_ms     = now;
  draft.version           = 1;

  observability::SpanScope span("booking.create");
  span.SetAttribute("restaurant.id", draft.restaurant_id);
  span.SetAttribute("booking.party_size", static_cast<std::int64_t>(draft.party_size));

  db::model::BookingRecord record;
  try {
    record = Place(target, draft, false, request.table_id(), {}, std::move(stop));
  } catch (const util::CapacityConflict& e) {
    observability::Metrics::Instance().RecordBookingOutcome("conflict");
    TABLEBOOK_LOG_INFO("booking rejected", {StringField("restaurant_id", draft.restaurant_id), StringField("date", draft.date),
                                            StringField("time", target.time), StringField("reason", e.what())});
    throw;
  } catch (const util::OverrideRequired& e) {
    observability::Metrics::Instance().RecordBookingOutcome("override_required");
    TABLEBOOK_LOG_INFO("booking needs pacing override",
                       {StringField("restaurant_id", draft.restaurant_id), StringField("date", draft.date), StringField("time", target.time),
                        observability::DoubleField("utilization_percent", e.utilization_percent())});
    throw;
  }

  if (record.pacing_overridden) {
    observability::Metrics::Instance().RecordBookingOutcome("overridden");
    TABLEBOOK_LOG_WARN("pacing override", {StringField("booking_id", record.id), StringField("restaurant_id", record.restaurant_id),
                                           StringField("time", target.time), StringField("reason", record.override_reason),
                                           StringField("created_by", record.created_by)});
  } else {
    observability::Metrics::Instance().RecordBookingOutcome("created");
  }
  TABLEBOOK_LOG_INFO("booking created", {StringField("booking_id", record.id), StringField("restaurant_id", record.restaurant_id),
                                         StringField("date", record.date), StringField("time", target.time),
                                         IntField("party_size", record.party_size), IntField("tables", static_cast<int64_t>(record.table_ids.size()))});
  return ToBooking(record);
}

Booking BookingManager::Modify(const ModifyBookingRequest& request, std::stop_token stop) {
  const auto existing = LoadBooking(request.booking_id());
  if (!Modifiable(existing.status)) {
    throw util::InvalidState("booking " + existing.id + " is " + BookingStatus_Name(existing.status) + " and cannot be modified");
  }

  const std::string date  = request.date().empty() ? existing.date : request.date();
  const std::string time  = request.time().empty() ? util::FormatTimeOfDay(existing.start_minute) : request.time();
  const uint32_t    party = request.party_size() > 0 ? request.party_size() : existing.party_size;

  auto target = Validate(existing.restaurant_id, date, time, party, request.duration_minutes(), request.override_pacing(),
                         request.override_reason(), existing.source);
  if (request.duration_minutes() == 0 && party == existing.party_size) target.duration_minutes = existing.duration_minutes;

  db::model::BookingRecord draft = existing;
  draft.date                     = target.date;
  draft.start_minute             = target.minute;
  draft.party_size               = target.party_size;
  draft.duration_minutes         = target.duration_minutes;
  draft.updated_at_ms            = util::ToUnixMillis(clock_());

  const std::string keep_table = existing.table_ids.size() == 1 ? existing.table_ids.front() : std::string();

  db::model::BookingRecord record;
  try {
    record = Place(target, draft, true, {}, keep_table, std::move(stop));
  } catch (const util::CapacityConflict&) {
    observability::Metrics::Instance().RecordBookingOutcome("conflict");
    throw;
  } catch (const util::OverrideRequired&) {
    observability::Metrics::Instance().RecordBookingOutcome("override_required");
    throw;
  }

  observability::Metrics::Instance().RecordBookingOutcome("modified");
  TABLEBOOK_LOG_INFO("booking modified", {StringField("booking_id", record.id), StringField("date", record.date),
                                          StringField("time", target.time), IntField("party_size", record.party_size),
                                          observability::BoolField("pacing_overridden", record.pacing_overridden)});
  return ToBooking(record);
}

Booking BookingManager::Transition(const std::string& booking_id, BookingStatus status, const std::string& note,
                                   std::stop_token stop) {
  const auto existing = LoadBooking(booking_id);
  const auto key      = locks_->SlotKey(existing.restaurant_id, existing.date, util::FormatTimeOfDay(existing.start_minute));

  auto record = locks_->WithLock(
      key,
      [&](lock::LockLease& lease) {
        auto tx     = repository_->BeginBounded(lease.Remaining());
        auto stored = repository_->GetBooking(*tx, booking_id);
        if (!stored) throw util::NotFound("booking not found: " + booking_id);
        if (stored->status == status) return *stored;

        if (!tablebook::model::CanTransition(stored->status, status)) {
          throw util::InvalidState("booking " + booking_id + " cannot move from " + BookingStatus_Name(stored->status) + " to " +
                                   BookingStatus_Name(status));
        }

        auto updated   = *stored;
        updated.status = status;
        if (!note.empty()) updated.notes = updated.notes.empty() ? note : updated.notes + "\n" + note;
        updated.updated_at_ms = util::ToUnixMillis(clock_());
        updated.version       = stored->version + 1;

        lease.EnsureHeld();
        util::ThrowIfDbError(repository_->UpdateBooking(*tx, updated), "update booking status");
        tx->Commit();
        return updated;
      },
      std::move(stop));

  TABLEBOOK_LOG_INFO("booking status changed",
                     {StringField("booking_id", booking_id), StringField("status", BookingStatus_Name(record.status))});
  return ToBooking(record);
}

Booking BookingManager::Cancel(const CancelBookingRequest& request, std::stop_token stop) {
  const std::string note = request.reason().empty() ? std::string() : "Cancelled: " + request.reason();
  auto              out  = Transition(request.booking_id(), BOOKING_STATUS_CANCELLED, note, std::move(stop));
  observability::Metrics::Instance().RecordBookingOutcome("cancelled");
  return out;
}

Booking BookingManager::UpdateStatus(const UpdateBookingStatusRequest& request, std::stop_token stop) {
  if (request.status() == BOOKING_STATUS_UNSPECIFIED) {
    throw util::InvalidArgument("status is required", "STATUS");
  }
  return Transition(request.booking_id(), request.status(), {}, std::move(stop));
}

db::model::BookingRecord BookingManager::LoadBooking(const std::string& booking_id) {
  if (booking_id.empty()) throw util::InvalidArgument("booking_id is required", "BOOKING_ID");

  auto tx     = repository_->BeginRead();
  auto record = repository_->GetBooking(*tx, booking_id);
  if (!record) throw util::NotFound("booking not found: " + booking_id);
  return *record;
}

Booking BookingManager::Get(const std::string& booking_id) {
  return ToBooking(LoadBooking(booking_id));
}

std::vector<Booking> BookingManager::List(const std::string& restaurant_id, const std::string& date) {
  if (!util::ParseDate(date)) throw util::InvalidArgument("date must be YYYY-MM-DD: '" + date + "'", "DATE_FORMAT");

  auto tx = repository_->BeginRead();
  if (!repository_->GetRestaurant(*tx, restaurant_id)) throw util::NotFound("restaurant not found: " + restaurant_id);

  std::vector<Booking> out;
  for (const auto& record : repository_->ListBookings(*tx, restaurant_id, date)) out.push_back(ToBooking(record));
  return out;
}

} // namespace tablebook::core

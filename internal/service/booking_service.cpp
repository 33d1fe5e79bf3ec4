#include "booking_service.hpp"

#include "internal/core/availability_reporter.hpp"
#include "internal/core/booking_manager.hpp"
#include "observe_rpc.hpp"

namespace tablebook::service {

using namespace tablebook::v1;

namespace {

BookingConflict PhysicallyFull(const tablebook::util::CapacityConflict& e, std::vector<std::string> alternatives) {
  BookingConflict conflict;
  conflict.set_reason(CONFLICT_REASON_PHYSICALLY_FULL);
  conflict.set_message(e.what());
  conflict.set_pacing_status(PACING_STATUS_PHYSICALLY_FULL);
  for (auto& time : alternatives) conflict.add_alternative_times(std::move(time));
  return conflict;
}

BookingConflict OverrideNeeded(const tablebook::util::OverrideRequired& e, std::vector<std::string> alternatives) {
  BookingConflict conflict;
  conflict.set_reason(CONFLICT_REASON_OVERRIDE_REQUIRED);
  conflict.set_message(e.what());
  conflict.set_pacing_status(PACING_STATUS_PACING_FULL);
  conflict.set_utilization_percent(e.utilization_percent());
  for (auto& time : alternatives) conflict.add_alternative_times(std::move(time));
  return conflict;
}

} // namespace

BookingService::BookingService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

std::vector<std::string> BookingService::AlternativeTimes(const std::string& restaurant_id, const std::string& date,
                                                          const std::string& time, uint32_t party_size,
                                                          uint32_t duration_minutes) const {
  GetAvailabilityRequest req;
  req.set_restaurant_id(restaurant_id);
  req.set_date(date);
  req.set_party_size(party_size);
  req.set_preferred_time(time);
  req.set_duration_minutes(duration_minutes);

  try {
    const auto report = ctx_.reporter->Report(req);
    return {report.preferred_time_alternatives().begin(), report.preferred_time_alternatives().end()};
  } catch (const std::exception& e) {
    // the conflict itself is still returned, only without suggestions
    TABLEBOOK_LOG_WARN("alternative times unavailable", {tablebook::observability::StringField("restaurant_id", restaurant_id),
                                                         tablebook::observability::StringField("date", date),
                                                         tablebook::observability::StringField("error", e.what())});
    return {};
  }
}

CreateBookingResponse BookingService::CreateBooking(const CreateBookingRequest& req) {
  return ObserveRpc("BookingService.CreateBooking", req.restaurant_id(), [&] {
    CreateBookingResponse resp;
    try {
      *resp.mutable_booking() = ctx_.bookings->Create(req);
    } catch (const tablebook::util::CapacityConflict& e) {
      *resp.mutable_conflict() =
          PhysicallyFull(e, AlternativeTimes(req.restaurant_id(), req.date(), req.time(), req.party_size(), req.duration_minutes()));
    } catch (const tablebook::util::OverrideRequired& e) {
      *resp.mutable_conflict() =
          OverrideNeeded(e, AlternativeTimes(req.restaurant_id(), req.date(), req.time(), req.party_size(), req.duration_minutes()));
    }
    return resp;
  });
}

ModifyBookingResponse BookingService::ModifyBooking(const ModifyBookingRequest& req) {
  return ObserveRpc("BookingService.ModifyBooking", {}, [&] {
    ModifyBookingResponse resp;
    try {
      *resp.mutable_booking() = ctx_.bookings->Modify(req);
    } catch (const tablebook::util::CapacityConflict& e) {
      const auto current = ctx_.bookings->Get(req.booking_id());
      *resp.mutable_conflict() =
          PhysicallyFull(e, AlternativeTimes(current.restaurant_id(), req.date().empty() ? current.date() : req.date(),
                                             req.time().empty() ? current.time() : req.time(),
                                             req.party_size() > 0 ? req.party_size() : current.party_size(), req.duration_minutes()));
    } catch (const tablebook::util::OverrideRequired& e) {
      const auto current = ctx_.bookings->Get(req.booking_id());
      *resp.mutable_conflict() =
          OverrideNeeded(e, AlternativeTimes(current.restaurant_id(), req.date().empty() ? current.date() : req.date(),
                                             req.time().empty() ? current.time() : req.time(),
                                             req.party_size() > 0 ? req.party_size() : current.party_size(), req.duration_minutes()));
    }
    return resp;
  });
}

CancelBookingResponse BookingService::CancelBooking(const CancelBookingRequest& req) {
  return ObserveRpc("BookingService.CancelBooking", {}, [&] {
    CancelBookingResponse resp;
    *resp.mutable_booking() = ctx_.bookings->Cancel(req);
    return resp;
  });
}

UpdateBookingStatusResponse BookingService::UpdateBookingStatus(const UpdateBookingStatusRequest& req) {
  return ObserveRpc("BookingService.UpdateBookingStatus", {}, [&] {
    UpdateBookingStatusResponse resp;
    *resp.mutable_booking() = ctx_.bookings->UpdateStatus(req);
    return resp;
  });
}

GetBookingResponse BookingService::GetBooking(const GetBookingRequest& req) {
  return ObserveRpc("BookingService.GetBooking", {}, [&] {
    GetBookingResponse resp;
    *resp.mutable_booking() = ctx_.bookings->Get(req.booking_id());
    return resp;
  });
}

ListBookingsResponse BookingService::ListBookings(const ListBookingsRequest& req) {
  return ObserveRpc("BookingService.ListBookings", req.restaurant_id(), [&] {
    ListBookingsResponse resp;
    for (auto& booking : ctx_.bookings->List(req.restaurant_id(), req.date())) *resp.add_bookings() = std::move(booking);
    return resp;
  });
}

} // namespace tablebook::service

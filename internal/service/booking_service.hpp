#pragma once

#include <string>
#include <vector>

#include "service_context.hpp"
#include "tablebook/v1.hpp"

namespace tablebook::service {

/*
  Booking RPCs.

  Create and Modify answer capacity conflicts and pacing-override
  requests with a BookingConflict carrying alternative times, looked up
  after the booking lock has been released. Every other failure is
  thrown for the transport to map.
*/
class BookingService {
public:
  explicit BookingService(ServiceContext ctx);

  tablebook::v1::CreateBookingResponse
  CreateBooking(const tablebook::v1::CreateBookingRequest& req);

  tablebook::v1::ModifyBookingResponse
  ModifyBooking(const tablebook::v1::ModifyBookingRequest& req);

  tablebook::v1::CancelBookingResponse
  CancelBooking(const tablebook::v1::CancelBookingRequest& req);

  tablebook::v1::UpdateBookingStatusResponse
  UpdateBookingStatus(const tablebook::v1::UpdateBookingStatusRequest& req);

  tablebook::v1::GetBookingResponse
  GetBooking(const tablebook::v1::GetBookingRequest& req);

  tablebook::v1::ListBookingsResponse
  ListBookings(const tablebook::v1::ListBookingsRequest& req);

private:
  std::vector<std::string> AlternativeTimes(const std::string& restaurant_id, const std::string& date, const std::string& time,
                                            uint32_t party_size, uint32_t duration_minutes) const;

  ServiceContext ctx_;
};

}

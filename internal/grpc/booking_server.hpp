#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "internal/service/booking_service.hpp"
#include "tablebook/v1_services.hpp"

namespace tablebook::grpc {

class BookingServer final : public tablebook::v1::BookingService::Service {
public:
  explicit BookingServer(std::shared_ptr<tablebook::service::BookingService> svc);

  ::grpc::Status CreateBooking(::grpc::ServerContext*,
                               const tablebook::v1::CreateBookingRequest*,
                               tablebook::v1::CreateBookingResponse*) override;

  ::grpc::Status ModifyBooking(::grpc::ServerContext*,
                               const tablebook::v1::ModifyBookingRequest*,
                               tablebook::v1::ModifyBookingResponse*) override;

  ::grpc::Status CancelBooking(::grpc::ServerContext*,
                               const tablebook::v1::CancelBookingRequest*,
                               tablebook::v1::CancelBookingResponse*) override;

  ::grpc::Status UpdateBookingStatus(::grpc::ServerContext*,
                                     const tablebook::v1::UpdateBookingStatusRequest*,
                                     tablebook::v1::UpdateBookingStatusResponse*) override;

  ::grpc::Status GetBooking(::grpc::ServerContext*,
                            const tablebook::v1::GetBookingRequest*,
                            tablebook::v1::GetBookingResponse*) override;

  ::grpc::Status ListBookings(::grpc::ServerContext*,
                              const tablebook::v1::ListBookingsRequest*,
                              tablebook::v1::ListBookingsResponse*) override;

private:
  std::shared_ptr<tablebook::service::BookingService> service_;
};

}

#include "booking_server.hpp"
#include "grpc_error.hpp"

namespace tablebook::grpc {

BookingServer::BookingServer(std::shared_ptr<tablebook::service::BookingService> svc)
    : service_(std::move(svc)) {}

::grpc::Status BookingServer::CreateBooking(::grpc::ServerContext*,
                                            const tablebook::v1::CreateBookingRequest* req,
                                            tablebook::v1::CreateBookingResponse* resp) {
  try {
    *resp = service_->CreateBooking(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BookingServer::ModifyBooking(::grpc::ServerContext*,
                                            const tablebook::v1::ModifyBookingRequest* req,
                                            tablebook::v1::ModifyBookingResponse* resp) {
  try {
    *resp = service_->ModifyBooking(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BookingServer::CancelBooking(::grpc::ServerContext*,
                                            const tablebook::v1::CancelBookingRequest* req,
                                            tablebook::v1::CancelBookingResponse* resp) {
  try {
    *resp = service_->CancelBooking(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BookingServer::UpdateBookingStatus(::grpc::ServerContext*,
                                                  const tablebook::v1::UpdateBookingStatusRequest* req,
                                                  tablebook::v1::UpdateBookingStatusResponse* resp) {
  try {
    *resp = service_->UpdateBookingStatus(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BookingServer::GetBooking(::grpc::ServerContext*,
                                         const tablebook::v1::GetBookingRequest* req,
                                         tablebook::v1::GetBookingResponse* resp) {
  try {
    *resp = service_->GetBooking(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BookingServer::ListBookings(::grpc::ServerContext*,
                                           const tablebook::v1::ListBookingsRequest* req,
                                           tablebook::v1::ListBookingsResponse* resp) {
  try {
    *resp = service_->ListBookings(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

}

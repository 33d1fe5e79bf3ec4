#include "availability_server.hpp"
#include "grpc_error.hpp"

namespace tablebook::grpc {

AvailabilityServer::AvailabilityServer(std::shared_ptr<tablebook::service::AvailabilityService> svc)
    : service_(std::move(svc)) {}

::grpc::Status AvailabilityServer::GetAvailability(::grpc::ServerContext*,
                                                   const tablebook::v1::GetAvailabilityRequest* req,
                                                   tablebook::v1::GetAvailabilityResponse* resp) {
  try {
    *resp = service_->GetAvailability(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AvailabilityServer::GetAvailableTables(::grpc::ServerContext*,
                                                      const tablebook::v1::GetAvailableTablesRequest* req,
                                                      tablebook::v1::GetAvailableTablesResponse* resp) {
  try {
    *resp = service_->GetAvailableTables(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

}

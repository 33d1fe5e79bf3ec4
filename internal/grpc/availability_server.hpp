#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "internal/service/availability_service.hpp"
#include "tablebook/v1_services.hpp"

namespace tablebook::grpc {

class AvailabilityServer final : public tablebook::v1::AvailabilityService::Service {
public:
  explicit AvailabilityServer(std::shared_ptr<tablebook::service::AvailabilityService> svc);

  ::grpc::Status GetAvailability(::grpc::ServerContext*,
                                 const tablebook::v1::GetAvailabilityRequest*,
                                 tablebook::v1::GetAvailabilityResponse*) override;

  ::grpc::Status GetAvailableTables(::grpc::ServerContext*,
                                    const tablebook::v1::GetAvailableTablesRequest*,
                                    tablebook::v1::GetAvailableTablesResponse*) override;

private:
  std::shared_ptr<tablebook::service::AvailabilityService> service_;
};

}

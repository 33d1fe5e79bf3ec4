#pragma once

#include "service_context.hpp"
#include "tablebook/v1.hpp"

namespace tablebook::service {

class AvailabilityService {
public:
  explicit AvailabilityService(ServiceContext ctx);

  tablebook::v1::GetAvailabilityResponse
  GetAvailability(const tablebook::v1::GetAvailabilityRequest& req);

  tablebook::v1::GetAvailableTablesResponse
  GetAvailableTables(const tablebook::v1::GetAvailableTablesRequest& req);

private:
  ServiceContext ctx_;
};

}

#include "availability_service.hpp"

#include "internal/core/availability_reporter.hpp"
#include "observe_rpc.hpp"

namespace tablebook::service {

using namespace tablebook::v1;

AvailabilityService::AvailabilityService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

GetAvailabilityResponse AvailabilityService::GetAvailability(const GetAvailabilityRequest& req) {
  return ObserveRpc("AvailabilityService.GetAvailability", req.restaurant_id(), [&] { return ctx_.reporter->Report(req); });
}

GetAvailableTablesResponse AvailabilityService::GetAvailableTables(const GetAvailableTablesRequest& req) {
  return ObserveRpc("AvailabilityService.GetAvailableTables", req.restaurant_id(),
                    [&] { return ctx_.reporter->AvailableTables(req); });
}

} // namespace tablebook::service

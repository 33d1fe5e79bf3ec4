#pragma once

#include "service_context.hpp"
#include "tablebook/v1.hpp"

namespace tablebook::service {

class AdminService {
public:
  explicit AdminService(ServiceContext ctx);

  tablebook::v1::LockStatsResponse
  GetLockStats(const tablebook::v1::LockStatsRequest& req);

  tablebook::v1::SweepExpiredLocksResponse
  SweepExpiredLocks(const tablebook::v1::SweepExpiredLocksRequest& req);

  tablebook::v1::HealthResponse
  Health(const tablebook::v1::HealthRequest& req);

private:
  ServiceContext ctx_;
};

}

#include "admin_service.hpp"

#include "internal/db/api/repository.hpp"
#include "internal/lock/lock_coordinator.hpp"
#include "observe_rpc.hpp"

namespace tablebook::service {

using namespace tablebook::v1;

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

LockStatsResponse AdminService::GetLockStats(const LockStatsRequest&) {
  return ObserveRpc("AdminService.GetLockStats", {}, [&] {
    const auto        stats = ctx_.locks->Stats();
    LockStatsResponse resp;
    resp.set_total(stats.total);
    resp.set_active(stats.active);
    resp.set_expired(stats.expired);
    return resp;
  });
}

SweepExpiredLocksResponse AdminService::SweepExpiredLocks(const SweepExpiredLocksRequest&) {
  return ObserveRpc("AdminService.SweepExpiredLocks", {}, [&] {
    SweepExpiredLocksResponse resp;
    resp.set_removed(ctx_.locks->SweepExpired());
    TABLEBOOK_LOG_INFO("expired locks swept", {tablebook::observability::IntField("removed", static_cast<int64_t>(resp.removed()))});
    return resp;
  });
}

HealthResponse AdminService::Health(const HealthRequest&) {
  return ObserveRpc("AdminService.Health", {}, [&] {
    HealthResponse resp;
    resp.set_serving(true);
    resp.set_backend(ctx_.repository->BackendName());
    resp.set_active_locks(ctx_.locks->Stats().active);
    return resp;
  });
}

} // namespace tablebook::service

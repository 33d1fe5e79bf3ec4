#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "internal/service/admin_service.hpp"
#include "tablebook/v1_services.hpp"

namespace tablebook::grpc {

class AdminServer final : public tablebook::v1::AdminService::Service {
public:
  explicit AdminServer(std::shared_ptr<tablebook::service::AdminService> svc);

  ::grpc::Status GetLockStats(::grpc::ServerContext*,
                              const tablebook::v1::LockStatsRequest*,
                              tablebook::v1::LockStatsResponse*) override;

  ::grpc::Status SweepExpiredLocks(::grpc::ServerContext*,
                                   const tablebook::v1::SweepExpiredLocksRequest*,
                                   tablebook::v1::SweepExpiredLocksResponse*) override;

  ::grpc::Status Health(::grpc::ServerContext*,
                        const tablebook::v1::HealthRequest*,
                        tablebook::v1::HealthResponse*) override;

private:
  std::shared_ptr<tablebook::service::AdminService> service_;
};

}

#include "admin_server.hpp"
#include "grpc_error.hpp"

namespace tablebook::grpc {

AdminServer::AdminServer(std::shared_ptr<tablebook::service::AdminService> svc)
    : service_(std::move(svc)) {}

::grpc::Status AdminServer::GetLockStats(::grpc::ServerContext*,
                                         const tablebook::v1::LockStatsRequest* req,
                                         tablebook::v1::LockStatsResponse* resp) {
  try {
    *resp = service_->GetLockStats(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::SweepExpiredLocks(::grpc::ServerContext*,
                                              const tablebook::v1::SweepExpiredLocksRequest* req,
                                              tablebook::v1::SweepExpiredLocksResponse* resp) {
  try {
    *resp = service_->SweepExpiredLocks(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::Health(::grpc::ServerContext*,
                                   const tablebook::v1::HealthRequest* req,
                                   tablebook::v1::HealthResponse* resp) {
  try {
    *resp = service_->Health(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

}

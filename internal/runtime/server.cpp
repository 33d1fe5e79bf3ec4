#include "server.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace tablebook::runtime {

Server::Server(std::string bind_address, std::vector<std::unique_ptr<::grpc::Service>> services,
               std::chrono::milliseconds shutdown_grace)
    : bind_address_(std::move(bind_address)), services_(std::move(services)), shutdown_grace_(shutdown_grace) {}

Server::~Server() {
  Stop();
}

void Server::Start() {
  ::grpc::ServerBuilder builder;

  builder.AddListeningPort(bind_address_, ::grpc::InsecureServerCredentials(), &bound_port_);
  for (auto& service : services_) builder.RegisterService(service.get());

  grpc_server_ = builder.BuildAndStart();

  if (!grpc_server_) {
    throw std::runtime_error("failed to start booking server on " + bind_address_);
  }

  TABLEBOOK_LOG_INFO("booking server listening", {tablebook::observability::StringField("bind_address", bind_address_),
                                                  tablebook::observability::IntField("port", bound_port_),
                                                  tablebook::observability::IntField("services", static_cast<int64_t>(services_.size()))});
}

void Server::Wait() {
  if (grpc_server_)
    grpc_server_->Wait();
}

void Server::Stop() {
  if (!grpc_server_) return;

  TABLEBOOK_LOG_INFO("draining booking server", {tablebook::observability::IntField("grace_ms", shutdown_grace_.count())});
  grpc_server_->Shutdown(std::chrono::system_clock::now() + shutdown_grace_);
  grpc_server_.reset();
}

} // namespace tablebook::runtime

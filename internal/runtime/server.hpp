#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>
#include <grpcpp/impl/service_type.h>

namespace tablebook::runtime {

/*
  Owns the gRPC server and the registered service adapters.

  Stop() lets in-flight calls finish for up to the grace period (the
  booking lock TTL in tablebook-server), then cancels them.
*/
class Server {
public:
  Server(std::string bind_address, std::vector<std::unique_ptr<::grpc::Service>> services,
         std::chrono::milliseconds shutdown_grace = std::chrono::seconds(10));
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  void Start();
  void Wait();
  void Stop();

  // Port actually bound; differs from the requested one when ":0" was used.
  int BoundPort() const {
    return bound_port_;
  }

private:
  std::string bind_address_;
  std::vector<std::unique_ptr<::grpc::Service>> services_;
  std::unique_ptr<::grpc::Server> grpc_server_;
  std::chrono::milliseconds shutdown_grace_;
  int bound_port_ = 0;
};

} // namespace tablebook::runtime

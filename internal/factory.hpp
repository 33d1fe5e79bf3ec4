#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"

namespace tablebook::db { class Repository; }
namespace tablebook::lock { class LockCoordinator; class LockSweeper; }
namespace tablebook::core { class AvailabilityReporter; class BookingManager; }

namespace tablebook::factory {

/*
  Application

  Owns all long-lived objects used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository> repository;
  std::shared_ptr<lock::LockCoordinator> locks;
  std::shared_ptr<core::AvailabilityReporter> reporter;
  std::shared_ptr<core::BookingManager> bookings;

  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;

  // Started by Build; stopped when the Application is destroyed.
  std::vector<std::shared_ptr<lock::LockSweeper>> background_workers;
};

/*
  Build

  Constructs the entire backend based on runtime config: repository and
  schema, catalog seed, lock coordinator and sweeper, engine, services,
  gRPC adapters.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
Application Build(const tablebook::runtime::config::RuntimeConfig& config);

// Repository for the configured backend with its schema applied.
std::shared_ptr<db::Repository> BuildRepository(const tablebook::runtime::config::RuntimeConfig& config);

}

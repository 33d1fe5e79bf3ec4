#pragma once

#include <memory>

namespace tablebook::core { class AvailabilityReporter; class BookingManager; }
namespace tablebook::lock { class LockCoordinator; }
namespace tablebook::db { class Repository; }

namespace tablebook::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<tablebook::core::AvailabilityReporter> reporter;
  std::shared_ptr<tablebook::core::BookingManager> bookings;
  std::shared_ptr<tablebook::lock::LockCoordinator> locks;
  std::shared_ptr<tablebook::db::Repository> repository;
};

}

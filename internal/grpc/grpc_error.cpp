#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace tablebook::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace tablebook::util;

  const auto* error = dynamic_cast<const BookingError*>(&e);
  if (!error) {
    return {::grpc::StatusCode::INTERNAL, e.what()};
  }

  switch (error->kind()) {
    case ErrorKind::kInvalidArgument:
      return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
    case ErrorKind::kNotFound:
      return {::grpc::StatusCode::NOT_FOUND, e.what()};
    case ErrorKind::kAlreadyExists:
      return {::grpc::StatusCode::ALREADY_EXISTS, e.what()};
    case ErrorKind::kRestaurantClosed:
    case ErrorKind::kOverrideRequired:
    case ErrorKind::kInvalidState:
      return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
    case ErrorKind::kCapacityConflict:
      return {::grpc::StatusCode::ABORTED, e.what()};
    case ErrorKind::kLockBusy:
    case ErrorKind::kLockExpired:
      return {::grpc::StatusCode::UNAVAILABLE, e.what()};
    case ErrorKind::kCancelled:
      return {::grpc::StatusCode::CANCELLED, e.what()};
    case ErrorKind::kStorage: {
      const auto& storage = static_cast<const StorageError&>(*error);
      if (tablebook::db::IsTransient(storage.code())) {
        return {::grpc::StatusCode::UNAVAILABLE, e.what()};
      }
      return {::grpc::StatusCode::INTERNAL, e.what()};
    }
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace tablebook::grpc

#pragma once

#include <stdexcept>
#include <string>
#include <utility>

#include "internal/db/api/result.hpp"

namespace tablebook::util {

/*
  Central error types.

  Every error carries a closed ErrorKind. Retry classification and the
  gRPC status mapping switch on the kind, never on message text.
*/

enum class ErrorKind {
  kInvalidArgument,
  kNotFound,
  kAlreadyExists,
  kInvalidState,
  kRestaurantClosed,
  kCapacityConflict,
  kOverrideRequired,
  kLockBusy,
  kLockExpired,
  kCancelled,
  kStorage,
};

constexpr const char* ToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kInvalidArgument: return "invalid_argument";
    case ErrorKind::kNotFound: return "not_found";
    case ErrorKind::kAlreadyExists: return "already_exists";
    case ErrorKind::kInvalidState: return "invalid_state";
    case ErrorKind::kRestaurantClosed: return "restaurant_closed";
    case ErrorKind::kCapacityConflict: return "capacity_conflict";
    case ErrorKind::kOverrideRequired: return "override_required";
    case ErrorKind::kLockBusy: return "lock_busy";
    case ErrorKind::kLockExpired: return "lock_expired";
    case ErrorKind::kCancelled: return "cancelled";
    case ErrorKind::kStorage: return "storage";
  }
  return "unknown";
}

class BookingError : public std::runtime_error {
 public:
  BookingError(ErrorKind kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {
  }

  ErrorKind kind() const noexcept {
    return kind_;
  }

 private:
  ErrorKind kind_;
};

// Malformed input or a violated business rule. `rule` names the rule
// (PARTY_TOO_LARGE, TOO_SOON, ...) when one applies.
class InvalidArgument : public BookingError {
 public:
  explicit InvalidArgument(const std::string& msg, std::string rule = {})
      : BookingError(ErrorKind::kInvalidArgument, msg), rule_(std::move(rule)) {
  }

  const std::string& rule() const noexcept {
    return rule_;
  }

 private:
  std::string rule_;
};

class NotFound : public BookingError {
 public:
  explicit NotFound(const std::string& msg) : BookingError(ErrorKind::kNotFound, msg) {
  }
};

class AlreadyExists : public BookingError {
 public:
  explicit AlreadyExists(const std::string& msg) : BookingError(ErrorKind::kAlreadyExists, msg) {
  }
};

class InvalidState : public BookingError {
 public:
  explicit InvalidState(const std::string& msg) : BookingError(ErrorKind::kInvalidState, msg) {
  }
};

class RestaurantClosed : public BookingError {
 public:
  explicit RestaurantClosed(const std::string& msg) : BookingError(ErrorKind::kRestaurantClosed, msg) {
  }
};

enum class ConflictReason {
  kPhysicallyFull,
  kTableUnavailable,
};

class CapacityConflict : public BookingError {
 public:
  explicit CapacityConflict(const std::string& msg, ConflictReason reason = ConflictReason::kPhysicallyFull)
      : BookingError(ErrorKind::kCapacityConflict, msg), reason_(reason) {
  }

  ConflictReason reason() const noexcept {
    return reason_;
  }

 private:
  ConflictReason reason_;
};

// Expected branch of the booking flow: the slot is pacing-full and the
// caller must resubmit with an override reason.
class OverrideRequired : public BookingError {
 public:
  OverrideRequired(const std::string& msg, double utilization_percent)
      : BookingError(ErrorKind::kOverrideRequired, msg), utilization_percent_(utilization_percent) {
  }

  double utilization_percent() const noexcept {
    return utilization_percent_;
  }

 private:
  double utilization_percent_;
};

class LockBusy : public BookingError {
 public:
  explicit LockBusy(const std::string& msg) : BookingError(ErrorKind::kLockBusy, msg) {
  }
};

class LockExpired : public BookingError {
 public:
  explicit LockExpired(const std::string& msg) : BookingError(ErrorKind::kLockExpired, msg) {
  }
};

class Cancelled : public BookingError {
 public:
  explicit Cancelled(const std::string& msg) : BookingError(ErrorKind::kCancelled, msg) {
  }
};

class StorageError : public BookingError {
 public:
  StorageError(db::ErrorCode code, const std::string& msg) : BookingError(ErrorKind::kStorage, msg), code_(code) {
  }

  db::ErrorCode code() const noexcept {
    return code_;
  }

 private:
  db::ErrorCode code_;
};

// Converts a failed repository result into a StorageError.
inline void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }
  std::string message = context + ": " + db::ToString(result.code);
  if (!result.message.empty()) {
    message += ": " + result.message;
  }
  throw StorageError(result.code, message);
}

} // namespace tablebook::util

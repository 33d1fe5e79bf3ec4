#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace tablebook::lock {

/*
  Exclusive claim on one lock key.

  Held until released by its owner (matching token) or until
  expires_at passes, whichever comes first.
*/
struct Lock {
  std::string key;
  std::string token;

  std::chrono::steady_clock::time_point expires_at;
};

struct LockStats {
  std::size_t total   = 0;
  std::size_t active  = 0;
  std::size_t expired = 0;
};

} // namespace tablebook::lock

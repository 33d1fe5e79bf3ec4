#pragma once

#include <string>

namespace tablebook::util {

/*
  Identifier helpers.

  Booking ids and lock tokens are random RFC4122 v4 UUIDs in their
  canonical 36 character form.
*/
std::string GenerateId();

// 8 characters from an alphabet without 0/O and 1/I, printed on confirmations.
std::string GenerateConfirmationCode();

} // namespace tablebook::util

#pragma once

#include <cstddef>
#include <cstdint>

#include "internal/db/api/repository.hpp"
#include "tablebook/v1.hpp"

namespace tablebook::core {

/*
  Writes a RestaurantCatalog into storage.

  Each restaurant is upserted with its tables and turn-time rules in one
  transaction. Tables and rules without a restaurant_id inherit the
  entry's. Existing bookings are never touched.
*/
class CatalogSeeder {
 public:
  // Throws InvalidArgument on the first malformed entry.
  static void Validate(const tablebook::v1::RestaurantCatalog& catalog);

  // Returns the number of restaurants written.
  static std::size_t Seed(db::Repository& repository, const tablebook::v1::RestaurantCatalog& catalog, uint64_t now_ms);
};

} // namespace tablebook::core

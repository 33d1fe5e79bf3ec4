#pragma once

#include <string>

#include "config/config.pb.h"
#include "tablebook/core/v1/catalog.pb.h"

namespace tablebook::config {

/*
  Loads RuntimeConfig and the restaurant catalog from YAML files.

  YAML is converted to JSON then parsed into protobuf. Unknown fields
  are rejected. Quoted scalars always stay strings, so ids such as
  "12" and times such as "18:00" survive untouched.
*/
class ConfigLoader {
 public:
  static tablebook::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static tablebook::core::v1::RestaurantCatalog LoadCatalogFromYaml(const std::string& path);

  // Same conversion over an in-memory document.
  static tablebook::runtime::config::RuntimeConfig ParseYaml(const std::string& yaml);
  static tablebook::core::v1::RestaurantCatalog    ParseCatalogYaml(const std::string& yaml);
};

} // namespace tablebook::config

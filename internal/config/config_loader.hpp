#pragma once

#include <string>

#include "config/config.pb.h"
#include "internal/model/protect_block.hpp"

namespace claimstone::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. Throws util::InvalidConfig.
*/
class ConfigLoader {
 public:
  static claimstone::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
};

// Catalog entries in file order. Blocks without a type are dropped.
model::Catalog ToCatalog(const claimstone::runtime::config::RuntimeConfig& config);

} // namespace claimstone::config

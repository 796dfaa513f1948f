#pragma once

#include <string>

#include "internal/util/uuid.hpp"

namespace claimstone::model {

struct Identity {
  util::UUID  id{};
  std::string name;
};

} // namespace claimstone::model

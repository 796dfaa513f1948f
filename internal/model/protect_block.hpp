#pragma once

#include <string>
#include <vector>

namespace claimstone::model {

/*
  Catalog entry for one protectable block type.

  type is the raw block key (EMERALD_BLOCK); alias is the short name used by
  limit grants and players. display_name/lore are carried for the item layer.
*/

struct ProtectBlock {
  std::string type;
  std::string alias;

  std::string              display_name;
  std::vector<std::string> lore;

  bool operator==(const ProtectBlock&) const = default;
};

using Catalog = std::vector<ProtectBlock>;

} // namespace claimstone::model

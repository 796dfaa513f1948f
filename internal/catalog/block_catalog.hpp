#pragma once

#include <optional>
#include <string_view>

#include "internal/model/protect_block.hpp"

namespace claimstone::catalog {

/*
  Read-only view over the configured protect blocks.
*/
class BlockCatalog {
 public:
  BlockCatalog() = default;
  explicit BlockCatalog(model::Catalog blocks);

  // Exact match on the raw block key.
  const model::ProtectBlock* FindByType(std::string_view type) const;

  // Case-insensitive match against alias or raw key; first entry wins.
  const model::ProtectBlock* FindByAliasOrType(std::string_view name) const;

  bool IsProtectBlockType(std::string_view type) const {
    return FindByType(type) != nullptr;
  }

  const model::Catalog& Blocks() const {
    return blocks_;
  }

 private:
  model::Catalog blocks_;
};

} // namespace claimstone::catalog

#include "block_catalog.hpp"

#include "internal/util/strings.hpp"

namespace claimstone::catalog {

BlockCatalog::BlockCatalog(model::Catalog blocks) : blocks_(std::move(blocks)) {
}

const model::ProtectBlock* BlockCatalog::FindByType(std::string_view type) const {
  for (const auto& block : blocks_) {
    if (block.type == type) return &block;
  }
  return nullptr;
}

const model::ProtectBlock* BlockCatalog::FindByAliasOrType(std::string_view name) const {
  for (const auto& block : blocks_) {
    if (util::EqualsIgnoreCase(block.alias, name) || util::EqualsIgnoreCase(block.type, name)) return &block;
  }
  return nullptr;
}

} // namespace claimstone::catalog

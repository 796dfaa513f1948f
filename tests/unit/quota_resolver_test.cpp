#include "internal/quota/quota_resolver.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

namespace {

using claimstone::catalog::BlockCatalog;
using claimstone::model::ProtectBlock;
using claimstone::quota::kNoLimit;
using claimstone::quota::QuotaResolver;

BlockCatalog MakeCatalog() {
  return BlockCatalog({
      ProtectBlock{.type = "EMERALD_BLOCK", .alias = "64", .display_name = "64x64 Protection", .lore = {}},
      ProtectBlock{.type = "DIAMOND_BLOCK", .alias = "32", .display_name = "32x32 Protection", .lore = {}},
  });
}

void TestLargestPerBlockGrantWins() {
  QuotaResolver resolver;
  const auto    limits = resolver.PerBlockLimits(
      {"protectionstones.limit.64.2", "protectionstones.limit.64.5", "protectionstones.limit.EMERALD_BLOCK.3"}, MakeCatalog());

  assert(limits.size() == 1);
  assert(limits.at("EMERALD_BLOCK") == 5);
}

void TestPerBlockMatchesAliasOrTypeIgnoringCase() {
  QuotaResolver resolver;
  const auto    limits =
      resolver.PerBlockLimits({"protectionstones.limit.diamond_block.4", "protectionstones.limit.64.1"}, MakeCatalog());

  assert(limits.size() == 2);
  assert(limits.at("DIAMOND_BLOCK") == 4);
  assert(limits.at("EMERALD_BLOCK") == 1);
}

void TestUnknownBlockAndMalformedCountAreSkipped() {
  QuotaResolver resolver;
  const auto    limits = resolver.PerBlockLimits(
      {"protectionstones.limit.GOLD_BLOCK.9", "protectionstones.limit.64.abc", "protectionstones.limit.64.7x", "protectionstones.limit.32.2"},
      MakeCatalog());

  assert(limits.size() == 1);
  assert(limits.at("DIAMOND_BLOCK") == 2);
}

void TestGlobalLimit() {
  QuotaResolver resolver;
  assert(resolver.GlobalLimit({"protectionstones.limit.3"}) == 3);
  assert(resolver.GlobalLimit({"protectionstones.limit.3", "protectionstones.limit.10", "protectionstones.limit.1"}) == 10);
}

void TestGlobalLimitAbsentIsNoLimit() {
  QuotaResolver resolver;
  assert(resolver.GlobalLimit({}) == kNoLimit);
  assert(resolver.GlobalLimit({"protectionstones.limit.abc", "protectionstones.limit.64.2", "protectionstones.create"}) == kNoLimit);
}

void TestGlobalAndPerBlockGrantsDoNotMix() {
  QuotaResolver resolver;
  const auto    record = resolver.Resolve({"protectionstones.limit.64.2", "protectionstones.limit.6"}, MakeCatalog());

  assert(record.global == 6);
  assert(record.per_block.size() == 1);
  assert(record.per_block.at("EMERALD_BLOCK") == 2);
}

void TestOtherNamespacesAndShapesAreIgnored() {
  QuotaResolver resolver;
  const std::vector<std::string> grants = {
      "otherplugin.limit.64.9",
      "protectionstones.limits.64.9",
      "protectionstones.limit.64.9.extra",
      "protectionstones.limit",
      "protectionstones.limit..9",
  };

  const auto record = resolver.Resolve(grants, MakeCatalog());
  assert(record.per_block.empty());
  assert(record.global == kNoLimit);
}

// Trailing dots carry no segment: "limit.5." is the global grant "limit.5".
void TestTrailingDotsAreIgnored() {
  QuotaResolver resolver;
  assert(resolver.GlobalLimit({"protectionstones.limit.5."}) == 5);

  const auto record = resolver.Resolve({"protectionstones.limit.64.2.", "protectionstones.limit.32.7.."}, MakeCatalog());
  assert(record.global == kNoLimit);
  assert(record.per_block.size() == 2);
  assert(record.per_block.at("EMERALD_BLOCK") == 2);
  assert(record.per_block.at("DIAMOND_BLOCK") == 7);
}

void TestCustomNamespace() {
  QuotaResolver resolver("claims");
  const auto    record = resolver.Resolve({"claims.limit.32.4", "claims.limit.2", "protectionstones.limit.8"}, MakeCatalog());

  assert(record.global == 2);
  assert(record.per_block.at("DIAMOND_BLOCK") == 4);
}

} // namespace

int main() {
  TestLargestPerBlockGrantWins();
  TestPerBlockMatchesAliasOrTypeIgnoringCase();
  TestUnknownBlockAndMalformedCountAreSkipped();
  TestGlobalLimit();
  TestGlobalLimitAbsentIsNoLimit();
  TestGlobalAndPerBlockGrantsDoNotMix();
  TestOtherNamespacesAndShapesAreIgnored();
  TestTrailingDotsAreIgnored();
  TestCustomNamespace();

  std::cout << "claimstone_unit_quota_resolver: pass\n";
  return 0;
}

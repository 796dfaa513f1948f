#include "quota_resolver.hpp"

#include <algorithm>
#include <charconv>
#include <optional>
#include <string_view>

#include "internal/observability/logging.hpp"
#include "internal/util/strings.hpp"

namespace claimstone::quota {

namespace {

constexpr std::string_view kLimitSegment = "limit";
constexpr std::size_t      kBlockArity   = 4;
constexpr std::size_t      kGlobalArity  = 3;

std::optional<int> ParseCount(std::string_view text) {
  int value = 0;
  const auto* end = text.data() + text.size();
  auto [ptr, ec]  = std::from_chars(text.data(), end, value);
  if (ec != std::errc{} || ptr != end || text.empty()) return std::nullopt;
  return value;
}

// Segments of a limit grant, or empty if the grant is for something else.
std::vector<std::string_view> LimitSegments(std::string_view grant, std::string_view ns) {
  auto segments = util::Split(grant, '.');
  if (segments.size() < kGlobalArity || segments[0] != ns || segments[1] != kLimitSegment) return {};
  return segments;
}

} // namespace

QuotaResolver::QuotaResolver(std::string permission_namespace) : namespace_(std::move(permission_namespace)) {
}

std::unordered_map<std::string, int> QuotaResolver::PerBlockLimits(const std::vector<std::string>& grants, const catalog::BlockCatalog& catalog) const {
  std::unordered_map<std::string, int> limits;

  for (const auto& grant : grants) {
    const auto segments = LimitSegments(grant, namespace_);
    if (segments.size() != kBlockArity) continue;

    const auto* block = catalog.FindByAliasOrType(segments[2]);
    if (!block) continue;

    const auto count = ParseCount(segments[3]);
    if (!count) {
      CLAIMSTONE_LOG_DEBUG("ignoring limit grant with non-numeric count", {observability::StringField("grant", grant)});
      continue;
    }

    auto [it, inserted] = limits.try_emplace(block->type, *count);
    if (!inserted) it->second = std::max(it->second, *count);
  }

  return limits;
}

int QuotaResolver::GlobalLimit(const std::vector<std::string>& grants) const {
  int max = kNoLimit;

  for (const auto& grant : grants) {
    const auto segments = LimitSegments(grant, namespace_);
    if (segments.size() != kGlobalArity) continue;

    if (auto count = ParseCount(segments[2])) {
      max = std::max(max, *count);
    } else {
      CLAIMSTONE_LOG_DEBUG("ignoring limit grant with non-numeric count", {observability::StringField("grant", grant)});
    }
  }

  return max;
}

QuotaRecord QuotaResolver::Resolve(const std::vector<std::string>& grants, const catalog::BlockCatalog& catalog) const {
  QuotaRecord record;
  record.per_block = PerBlockLimits(grants, catalog);
  record.global    = GlobalLimit(grants);
  return record;
}

} // namespace claimstone::quota

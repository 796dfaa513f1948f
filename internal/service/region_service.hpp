#pragma once

#include <future>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/migration/identifier_migration.hpp"
#include "internal/model/protect_block.hpp"
#include "internal/model/region_record.hpp"
#include "internal/quota/quota_resolver.hpp"
#include "internal/util/uuid.hpp"
#include "command_registry.hpp"
#include "service_context.hpp"

namespace claimstone::service {

/*
  Entry point for the command, event and economy layers.
*/
class RegionService {
public:
  explicit RegionService(ServiceContext ctx);

  // ------------------------------------------------------------------
  // Lookup
  // ------------------------------------------------------------------

  std::vector<model::RegionRecord> Resolve(const std::string& world, const std::string& token);

  bool AliasExistsAnywhere(const std::string& alias);

  std::vector<model::RegionRecord> RegionsForPrincipal(const std::string& world, const util::UUID& principal, bool include_members);

  // Keeps the name index in step with a rename done through the command
  // layer. Either alias may be empty.
  void OnRegionRenamed(const std::string& world, const std::string& id, const std::string& old_alias, const std::string& new_alias);

  // ------------------------------------------------------------------
  // Quotas
  // ------------------------------------------------------------------

  std::unordered_map<std::string, int> PerBlockLimits(const util::UUID& principal);
  int GlobalLimit(const util::UUID& principal);

  std::unordered_map<std::string, int> PerBlockLimits(const std::vector<std::string>& grants) const;
  int GlobalLimit(const std::vector<std::string>& grants) const;

  const model::ProtectBlock* FindBlock(const std::string& alias_or_type) const;

  // ------------------------------------------------------------------
  // Identities
  // ------------------------------------------------------------------

  std::optional<std::string> DisplayName(const util::UUID& principal) const;
  void RememberIdentity(const util::UUID& principal, const std::string& name);

  // ------------------------------------------------------------------
  // Maintenance
  // ------------------------------------------------------------------

  migration::MigrationReport RunMigrationIfPending();
  migration::MigrationReport RetryMigration();

  // Without a world the identity cache is reloaded as well; the returned
  // future becomes the migration's join point. With a world it is ready.
  std::shared_future<void> RebuildCaches(const std::optional<std::string>& world = std::nullopt);

  CommandRegistry& Commands() { return commands_; }

private:
  std::vector<std::string> GrantsFor(const util::UUID& principal);

  ServiceContext ctx_;
  CommandRegistry commands_;
};

}

#include "region_service.hpp"

#include "internal/cache/cache_builder.hpp"
#include "internal/config/settings_store.hpp"
#include "internal/identity/identity_cache.hpp"
#include "internal/index/region_name_index.hpp"
#include "internal/index/region_resolver.hpp"
#include "internal/observability/logging.hpp"
#include "internal/quota/permission_source.hpp"
#include "internal/util/errors.hpp"

namespace claimstone::service {

RegionService::RegionService(ServiceContext ctx) : ctx_(std::move(ctx)) {}

std::vector<model::RegionRecord> RegionService::Resolve(const std::string& world, const std::string& token) {
  return ctx_.resolver->Resolve(world, token);
}

bool RegionService::AliasExistsAnywhere(const std::string& alias) {
  return ctx_.resolver->AliasExistsAnywhere(alias);
}

std::vector<model::RegionRecord> RegionService::RegionsForPrincipal(const std::string& world, const util::UUID& principal, bool include_members) {
  return ctx_.resolver->RegionsForPrincipal(world, principal, include_members);
}

void RegionService::OnRegionRenamed(const std::string& world, const std::string& id, const std::string& old_alias, const std::string& new_alias) {
  if (!old_alias.empty()) ctx_.index->Remove(world, old_alias, id);
  if (!new_alias.empty()) ctx_.index->Add(world, new_alias, id);
}

std::vector<std::string> RegionService::GrantsFor(const util::UUID& principal) {
  if (!ctx_.permissions) {
    throw util::InvalidState("quota lookup: no permission source configured");
  }
  return ctx_.permissions->EffectiveGrants(principal);
}

std::unordered_map<std::string, int> RegionService::PerBlockLimits(const util::UUID& principal) {
  return PerBlockLimits(GrantsFor(principal));
}

int RegionService::GlobalLimit(const util::UUID& principal) {
  return GlobalLimit(GrantsFor(principal));
}

std::unordered_map<std::string, int> RegionService::PerBlockLimits(const std::vector<std::string>& grants) const {
  return ctx_.quota->PerBlockLimits(grants, ctx_.settings->Catalog());
}

int RegionService::GlobalLimit(const std::vector<std::string>& grants) const {
  return ctx_.quota->GlobalLimit(grants);
}

const model::ProtectBlock* RegionService::FindBlock(const std::string& alias_or_type) const {
  return ctx_.settings->Catalog().FindByAliasOrType(alias_or_type);
}

std::optional<std::string> RegionService::DisplayName(const util::UUID& principal) const {
  return ctx_.identities->NameFor(principal);
}

void RegionService::RememberIdentity(const util::UUID& principal, const std::string& name) {
  if (name.empty()) return;
  ctx_.identities->Put(principal, name);
}

migration::MigrationReport RegionService::RunMigrationIfPending() {
  return ctx_.migration->RunIfPending();
}

migration::MigrationReport RegionService::RetryMigration() {
  return ctx_.migration->RunPass();
}

std::shared_future<void> RegionService::RebuildCaches(const std::optional<std::string>& world) {
  ctx_.cache_builder->RebuildIndex(world);
  CLAIMSTONE_LOG_INFO("region cache rebuilt", {observability::StringField("world", world.value_or("*"))});

  if (world) {
    std::promise<void> done;
    done.set_value();
    return done.get_future().share();
  }

  auto loaded = ctx_.cache_builder->LoadIdentities(ctx_.identity_async_load, ctx_.push_profiles);
  ctx_.migration->WaitFor(loaded);
  return loaded;
}

}

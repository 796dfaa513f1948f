#pragma once

#include <memory>

namespace claimstone::db { class Repository; }
namespace claimstone::index { class RegionNameIndex; class RegionResolver; }
namespace claimstone::identity { class IdentityCache; }
namespace claimstone::quota { class QuotaResolver; class PermissionSource; }
namespace claimstone::migration { class IdentifierMigration; }
namespace claimstone::cache { class CacheBuilder; }
namespace claimstone::config { class SettingsStore; }

namespace claimstone::service {

/*
  Dependency container shared by all services.

  permissions may be null when the host has no permission system; quota
  calls that need it then throw util::InvalidState.
*/
struct ServiceContext {
  std::shared_ptr<claimstone::db::Repository> repository;
  std::shared_ptr<claimstone::index::RegionNameIndex> index;
  std::shared_ptr<claimstone::index::RegionResolver> resolver;
  std::shared_ptr<claimstone::identity::IdentityCache> identities;
  std::shared_ptr<claimstone::quota::QuotaResolver> quota;
  std::shared_ptr<claimstone::quota::PermissionSource> permissions;
  std::shared_ptr<claimstone::migration::IdentifierMigration> migration;
  std::shared_ptr<claimstone::cache::CacheBuilder> cache_builder;
  std::shared_ptr<claimstone::config::SettingsStore> settings;

  // identity load mode used at startup and on reload
  bool identity_async_load = false;
  bool push_profiles       = false;
};

}

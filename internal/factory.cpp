#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/cache/cache_builder.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/identity/identity_cache.hpp"
#include "internal/index/region_name_index.hpp"
#include "internal/index/region_resolver.hpp"
#include "internal/observability/logging.hpp"
#include "internal/quota/quota_resolver.hpp"
#include "internal/util/errors.hpp"
#if CLAIMSTONE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_identity_directory.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace claimstone::factory {

namespace {

constexpr const char* kDefaultPermissionNamespace = "protectionstones";

void BuildStore(const claimstone::runtime::config::RuntimeConfig& config, HostBindings& host) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if CLAIMSTONE_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    sqlite_db->BootstrapSchema();
    if (!host.repository) host.repository = std::make_shared<db::sqlite::SqliteRepository>(sqlite_db);
    if (!host.directory) host.directory = std::make_shared<db::sqlite::SqliteIdentityDirectory>(sqlite_db);
    return;
#else
    throw util::InvalidConfig("sqlite backend requested but not enabled at build time");
#endif
  }

  if (!host.repository) host.repository = std::make_shared<db::memory::MemoryRepository>();
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const claimstone::runtime::config::RuntimeConfig& config, std::shared_ptr<config::SettingsStore> settings, HostBindings host) {
  if (!settings) throw util::InvalidConfig("settings store is required");

  Application app;

  // ------------------------------------------------------------------
  // Store and caches
  // ------------------------------------------------------------------
  BuildStore(config, host);

  auto name_index = std::make_shared<index::RegionNameIndex>();
  auto identities = std::make_shared<identity::IdentityCache>();
  auto builder    = std::make_shared<cache::CacheBuilder>(host.repository, name_index, identities, host.directory, host.profiles);

  builder->RebuildIndex();
  app.identities_loaded = builder->LoadIdentities(config.identity().async_load(), config.identity().push_profiles());

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  const auto& ns = config.permissions().namespace_();

  auto resolver       = std::make_shared<index::RegionResolver>(host.repository, name_index);
  auto quota_resolver = std::make_shared<quota::QuotaResolver>(ns.empty() ? kDefaultPermissionNamespace : ns);
  auto migrator       = std::make_shared<migration::IdentifierMigration>(host.repository, identities, settings);
  migrator->WaitFor(app.identities_loaded);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  app.context.repository    = host.repository;
  app.context.index         = name_index;
  app.context.resolver      = resolver;
  app.context.identities    = identities;
  app.context.quota         = quota_resolver;
  app.context.permissions   = host.permissions;
  app.context.migration     = migrator;
  app.context.cache_builder = builder;
  app.context.settings      = settings;

  app.context.identity_async_load = config.identity().async_load();
  app.context.push_profiles       = config.identity().push_profiles();

  app.regions = std::make_shared<service::RegionService>(app.context);

  // ownership reads must not be served before legacy owners are converted
  CLAIMSTONE_LOG_INFO("checking if regions have been updated to uuids");
  app.startup_migration = app.regions->RunMigrationIfPending();

  CLAIMSTONE_LOG_INFO("claimstone started");
  return app;
}

} // namespace claimstone::factory

#pragma once

#include <future>
#include <memory>

#include "config/config.pb.h"

#include "internal/config/settings_store.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/identity/identity_directory.hpp"
#include "internal/migration/identifier_migration.hpp"
#include "internal/quota/permission_source.hpp"
#include "internal/service/region_service.hpp"
#include "internal/service/service_context.hpp"

namespace claimstone::factory {

/*
  Collaborators supplied by the host. Any of them may be null; a null
  repository or directory falls back to the configured database.
*/
struct HostBindings {
  std::shared_ptr<db::Repository>              repository;
  std::shared_ptr<identity::IdentityDirectory> directory;
  std::shared_ptr<identity::ProfileCache>      profiles;
  std::shared_ptr<quota::PermissionSource>     permissions;
};

/*
  Application

  Owns all long-lived objects. Everything here lives for the lifetime of
  the process (or until the host reloads).
*/
struct Application {
  service::ServiceContext                 context;
  std::shared_ptr<service::RegionService> regions;

  // Ready once the identity cache is fully populated.
  std::shared_future<void> identities_loaded;

  // Result of the startup migration; ran == false when it was not pending.
  migration::MigrationReport startup_migration;
};

/*
  Build

  Composition root. Runs the startup sequence:
    1. region name index, every world
    2. identity cache (background thread if identity.async_load)
    3. identifier migration if pending, after (2) has finished

  It is the ONLY place allowed to know concrete store types.
*/
Application Build(const claimstone::runtime::config::RuntimeConfig& config, std::shared_ptr<config::SettingsStore> settings,
                  HostBindings host = {});

} // namespace claimstone::factory

#pragma once

#include <cstddef>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/config/settings_store.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/identity/identity_cache.hpp"
#include "internal/model/region_record.hpp"

namespace claimstone::migration {

enum class MigrationState {
  kPending,
  kComplete,
};

enum class PrincipalRole {
  kOwner,
  kMember,
};

const char* RoleName(PrincipalRole role);

// A legacy name the identity cache could not map to a UUID.
struct UnresolvedLegacyOwner {
  std::string   world;
  std::string   region_id;
  std::string   name;
  PrincipalRole role = PrincipalRole::kOwner;
};

struct MigrationReport {
  bool        ran               = false;
  std::size_t regions_scanned   = 0;
  std::size_t regions_updated   = 0;
  std::size_t entries_converted = 0;

  std::vector<UnresolvedLegacyOwner> unresolved;
};

/*
  Rewrites legacy name-form owners/members of protected regions into
  UUID form.

  - RunIfPending() runs the pass once, gated by the persisted guard, and
    sets the guard afterwards even if some names stayed unresolved.
  - RunPass() runs the pass without consulting or setting the guard (an
    operator-triggered retry for names that failed the first time).
  - UUID-form entries are never touched, so any number of passes converge.
  - A store write failure aborts the pass with util::StoreError and leaves
    the guard unset.
*/
class IdentifierMigration {
 public:
  IdentifierMigration(std::shared_ptr<db::Repository> repository, std::shared_ptr<identity::IdentityCache> identities,
                      std::shared_ptr<config::SettingsStore> settings);

  // Name lookups are only authoritative once this future is ready; the pass
  // blocks on it before the first lookup. A later call replaces the join
  // point (identity reload).
  void WaitFor(std::shared_future<void> identities_loaded);

  MigrationState State() const;

  MigrationReport RunIfPending();
  MigrationReport RunPass();

 private:
  // Converts the legacy entries of one list in place. Returns how many
  // entries were rewritten.
  std::size_t Convert(const model::RegionRecord& record, std::vector<model::PrincipalRef>& refs, PrincipalRole role,
                      MigrationReport& report) const;

  void MigrateWorld(const std::string& world, MigrationReport& report);

  std::shared_ptr<db::Repository>          repository_;
  std::shared_ptr<identity::IdentityCache> identities_;
  std::shared_ptr<config::SettingsStore>   settings_;
  mutable std::mutex                       wait_mutex_;
  std::shared_future<void>                 identities_loaded_;
};

} // namespace claimstone::migration

#include "identifier_migration.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace claimstone::migration {

using observability::IntField;
using observability::StringField;

const char* RoleName(PrincipalRole role) {
  return role == PrincipalRole::kOwner ? "owner" : "member";
}

IdentifierMigration::IdentifierMigration(std::shared_ptr<db::Repository> repository, std::shared_ptr<identity::IdentityCache> identities,
                                         std::shared_ptr<config::SettingsStore> settings)
    : repository_(std::move(repository)), identities_(std::move(identities)), settings_(std::move(settings)) {
}

void IdentifierMigration::WaitFor(std::shared_future<void> identities_loaded) {
  std::scoped_lock lock(wait_mutex_);
  identities_loaded_ = std::move(identities_loaded);
}

MigrationState IdentifierMigration::State() const {
  return settings_->IdentifiersMigrated() ? MigrationState::kComplete : MigrationState::kPending;
}

MigrationReport IdentifierMigration::RunIfPending() {
  if (State() == MigrationState::kComplete) {
    return {};
  }

  CLAIMSTONE_LOG_INFO("converting legacy region owners to uuids");
  auto report = RunPass();
  settings_->MarkIdentifiersMigrated();
  return report;
}

MigrationReport IdentifierMigration::RunPass() {
  std::shared_future<void> loaded;
  {
    std::scoped_lock lock(wait_mutex_);
    loaded = identities_loaded_;
  }
  if (loaded.valid()) loaded.wait();

  MigrationReport report;
  report.ran = true;

  std::vector<std::string> worlds;
  {
    auto tx = repository_->Begin();
    worlds  = repository_->ListWorlds(*tx);
    tx->Commit();
  }

  for (const auto& world : worlds) {
    MigrateWorld(world, report);
  }

  for (const auto& entry : report.unresolved) {
    CLAIMSTONE_LOG_WARN("could not convert legacy region principal",
                        {StringField("world", entry.world), StringField("region", entry.region_id), StringField("name", entry.name),
                         StringField("role", RoleName(entry.role))});
  }

  CLAIMSTONE_LOG_INFO("identifier migration pass finished",
                      {IntField("regions_scanned", static_cast<std::int64_t>(report.regions_scanned)),
                       IntField("regions_updated", static_cast<std::int64_t>(report.regions_updated)),
                       IntField("entries_converted", static_cast<std::int64_t>(report.entries_converted)),
                       IntField("unresolved", static_cast<std::int64_t>(report.unresolved.size()))});
  return report;
}

void IdentifierMigration::MigrateWorld(const std::string& world, MigrationReport& report) {
  auto tx = repository_->Begin();

  for (auto& record : repository_->ListRegions(*tx, world)) {
    if (!model::IsProtectedRegion(record)) continue;
    ++report.regions_scanned;

    std::size_t converted = Convert(record, record.owners, PrincipalRole::kOwner, report);
    converted += Convert(record, record.members, PrincipalRole::kMember, report);
    if (converted == 0) continue;

    if (auto result = repository_->UpsertRegion(*tx, record); !result) {
      throw util::StoreError("migrate region " + world + "/" + record.id + ": " + result.Describe());
    }
    ++report.regions_updated;
    report.entries_converted += converted;
  }

  tx->Commit();
}

std::size_t IdentifierMigration::Convert(const model::RegionRecord& record, std::vector<model::PrincipalRef>& refs, PrincipalRole role,
                                         MigrationReport& report) const {
  std::size_t converted = 0;

  for (auto& ref : refs) {
    const auto* legacy = std::get_if<model::ByName>(&ref);
    if (!legacy) continue;

    if (auto id = identities_->IdFor(legacy->name)) {
      ref = model::ById{*id};
      ++converted;
    } else {
      report.unresolved.push_back({record.world, record.id, legacy->name, role});
    }
  }

  return converted;
}

} // namespace claimstone::migration

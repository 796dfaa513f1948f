#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/config/settings_store.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/factory.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

#if CLAIMSTONE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_identity_directory.hpp"
#endif

namespace {

using claimstone::db::memory::MemoryRepository;
using claimstone::model::ById;
using claimstone::model::ByName;
using claimstone::model::Identity;
using claimstone::model::PrincipalRef;
using claimstone::model::RegionRecord;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

class StaticDirectory final : public claimstone::identity::IdentityDirectory {
 public:
  explicit StaticDirectory(std::vector<Identity> identities) : identities_(std::move(identities)) {
  }

  std::vector<Identity> Enumerate() override {
    std::scoped_lock lock(mutex_);
    return identities_;
  }

  // a player who joined after startup
  void Add(Identity identity) {
    std::scoped_lock lock(mutex_);
    identities_.push_back(std::move(identity));
  }

 private:
  std::mutex            mutex_;
  std::vector<Identity> identities_;
};

class StaticPermissions final : public claimstone::quota::PermissionSource {
 public:
  std::vector<std::string> EffectiveGrants(const claimstone::util::UUID& principal) override {
    auto it = grants.find(claimstone::util::ToString(principal));
    return it == grants.end() ? std::vector<std::string>{} : it->second;
  }

  std::unordered_map<std::string, std::vector<std::string>> grants;
};

std::filesystem::path WriteConfig(const std::string& name, const std::string& database_block) {
  const auto dir = std::filesystem::temp_directory_path() / "claimstone_startup_tests";
  std::filesystem::create_directories(dir);

  const auto    path = dir / (name + "_" + std::to_string(NowMs()) + ".yaml");
  std::ofstream out(path);
  out << "database:\n"
      << database_block << "identity:\n"
      << "  async_load: true\n"
      << "  push_profiles: false\n"
      << "migration:\n"
      << "  identifiers_migrated: false\n"
      << "catalog:\n"
      << "  - type: EMERALD_BLOCK\n"
      << "    alias: 64\n"
      << "  - type: DIAMOND_BLOCK\n"
      << "    alias: \"32\"\n";
  return path;
}

RegionRecord MakeRegion(const std::string& id, const std::string& alias, std::vector<PrincipalRef> owners) {
  RegionRecord r;
  r.world      = "world";
  r.id         = id;
  r.alias      = alias;
  r.block_type = "EMERALD_BLOCK";
  r.owners     = std::move(owners);
  return r;
}

void TestStartupMigratesAndServes() {
  const auto alice = claimstone::util::GenerateUUID();
  const auto bob   = claimstone::util::GenerateUUID();

  auto repo = std::make_shared<MemoryRepository>();
  {
    auto tx = repo->Begin();
    auto w  = repo->CreateWorld(*tx, "world");
    auto r1 = repo->UpsertRegion(*tx, MakeRegion("ps1", "home", {ByName{"alice"}}));
    auto r2 = repo->UpsertRegion(*tx, MakeRegion("ps2", "home", {ById{bob}}));
    auto r3 = repo->UpsertRegion(*tx, MakeRegion("ps3", "farm", {ByName{"unknown_player"}}));
    assert(w && r1 && r2 && r3);
    tx->Commit();
  }

  auto permissions                                    = std::make_shared<StaticPermissions>();
  permissions->grants[claimstone::util::ToString(alice)] = {"protectionstones.limit.64.4", "protectionstones.limit.5", "essentials.home"};

  const auto path     = WriteConfig("memory", "  memory: {}\n");
  auto       config   = claimstone::config::ConfigLoader::LoadFromYaml(path.string());
  auto       settings = std::make_shared<claimstone::config::YamlSettingsStore>(path.string(), config);

  claimstone::factory::HostBindings host;
  host.repository  = repo;
  host.directory   = std::make_shared<StaticDirectory>(std::vector<Identity>{{alice, "alice"}, {bob, "bob"}});
  host.permissions = permissions;

  auto app = claimstone::factory::Build(config, settings, host);

  // startup ran the pass after the async identity load
  assert(app.identities_loaded.wait_for(std::chrono::seconds(0)) == std::future_status::ready);
  assert(app.startup_migration.ran);
  assert(app.startup_migration.entries_converted == 1);
  assert(app.startup_migration.unresolved.size() == 1);
  assert(app.startup_migration.unresolved[0].name == "unknown_player");
  assert(settings->IdentifiersMigrated());
  assert(claimstone::config::ConfigLoader::LoadFromYaml(path.string()).migration().identifiers_migrated());

  // name index was built before the pass and still resolves
  const auto homes = app.regions->Resolve("world", "home");
  assert(homes.size() == 2);
  assert(homes[0].owners == std::vector<PrincipalRef>{ById{alice}});

  const auto owned = app.regions->RegionsForPrincipal("world", alice, false);
  assert(owned.size() == 1 && owned[0].id == "ps1");

  assert(app.regions->DisplayName(bob) == std::optional<std::string>("bob"));
  assert(app.regions->AliasExistsAnywhere("farm"));

  // quotas via the host permission source and the configured catalog
  const auto limits = app.regions->PerBlockLimits(alice);
  assert(limits.size() == 1);
  assert(limits.at("EMERALD_BLOCK") == 4);
  assert(app.regions->GlobalLimit(alice) == 5);
  assert(app.regions->GlobalLimit(bob) == claimstone::quota::kNoLimit);
  assert(app.regions->FindBlock("32") != nullptr);

  // rename through the command layer, then an out-of-band delete
  {
    auto tx     = repo->Begin();
    auto farm   = repo->GetRegion(*tx, "world", "ps3");
    farm->alias = "ranch";
    auto ok     = repo->UpsertRegion(*tx, *farm);
    assert(ok);
    tx->Commit();
  }
  app.regions->OnRegionRenamed("world", "ps3", "farm", "ranch");
  assert(app.regions->Resolve("world", "ranch").size() == 1);
  assert(!app.regions->AliasExistsAnywhere("farm"));

  {
    auto tx = repo->Begin();
    auto ok = repo->DeleteRegion(*tx, "world", "ps2");
    assert(ok);
    tx->Commit();
  }
  assert(app.regions->Resolve("world", "home").size() == 1);

  // a later name for the unresolved owner is picked up by a retry
  const auto late = claimstone::util::GenerateUUID();
  app.regions->RememberIdentity(late, "unknown_player");
  const auto retry = app.regions->RetryMigration();
  assert(retry.entries_converted == 1);
  assert(retry.unresolved.empty());

  bool threw = false;
  try {
    (void)app.regions->Resolve("nether", "home");
  } catch (const claimstone::util::ScopeNotFound&) {
    threw = true;
  }
  assert(threw);

  std::filesystem::remove(path);
}

void TestSecondStartupSkipsMigration() {
  auto repo = std::make_shared<MemoryRepository>();
  {
    auto tx = repo->Begin();
    auto w  = repo->CreateWorld(*tx, "world");
    auto r  = repo->UpsertRegion(*tx, MakeRegion("ps1", "home", {ByName{"alice"}}));
    assert(w && r);
    tx->Commit();
  }

  const auto path = WriteConfig("second", "  memory: {}\n");
  {
    auto config   = claimstone::config::ConfigLoader::LoadFromYaml(path.string());
    auto settings = std::make_shared<claimstone::config::YamlSettingsStore>(path.string(), config);
    claimstone::factory::HostBindings host;
    host.repository = repo;
    auto first      = claimstone::factory::Build(config, settings, host);
    assert(first.startup_migration.ran);
  }

  auto config   = claimstone::config::ConfigLoader::LoadFromYaml(path.string());
  auto settings = std::make_shared<claimstone::config::YamlSettingsStore>(path.string(), config);
  claimstone::factory::HostBindings host;
  host.repository = repo;
  host.directory  = std::make_shared<StaticDirectory>(std::vector<Identity>{{claimstone::util::GenerateUUID(), "alice"}});
  auto second     = claimstone::factory::Build(config, settings, host);

  assert(!second.startup_migration.ran);
  auto tx     = repo->Begin();
  auto region = repo->GetRegion(*tx, "world", "ps1");
  tx->Commit();
  assert(region->owners == std::vector<PrincipalRef>{ByName{"alice"}});

  std::filesystem::remove(path);
}

void TestReloadRefreshesIndexAndIdentities() {
  auto repo = std::make_shared<MemoryRepository>();
  {
    auto tx = repo->Begin();
    auto w  = repo->CreateWorld(*tx, "world");
    auto r  = repo->UpsertRegion(*tx, MakeRegion("ps1", "home", {ByName{"carol"}}));
    assert(w && r);
    tx->Commit();
  }

  const auto path      = WriteConfig("reload", "  memory: {}\n");
  auto       config    = claimstone::config::ConfigLoader::LoadFromYaml(path.string());
  auto       settings  = std::make_shared<claimstone::config::YamlSettingsStore>(path.string(), config);
  auto       directory = std::make_shared<StaticDirectory>(std::vector<Identity>{});

  claimstone::factory::HostBindings host;
  host.repository = repo;
  host.directory  = directory;
  auto app        = claimstone::factory::Build(config, settings, host);
  assert(app.startup_migration.unresolved.size() == 1);

  // a player and a region the caches have not seen yet
  const auto carol = claimstone::util::GenerateUUID();
  directory->Add({carol, "carol"});
  {
    auto tx = repo->Begin();
    auto r  = repo->UpsertRegion(*tx, MakeRegion("ps2", "barn", {ById{carol}}));
    assert(r);
    tx->Commit();
  }
  assert(app.regions->Resolve("world", "barn").empty());

  auto reloaded = app.regions->RebuildCaches();

  // the retry joins on the reload before looking names up
  const auto retry = app.regions->RetryMigration();
  assert(reloaded.wait_for(std::chrono::seconds(0)) == std::future_status::ready);
  assert(retry.entries_converted == 1);
  assert(retry.unresolved.empty());
  assert(app.regions->DisplayName(carol) == std::optional<std::string>("carol"));
  assert(app.regions->Resolve("world", "barn").size() == 1);

  // a single-world rebuild leaves identities alone and is ready at once
  auto single = app.regions->RebuildCaches(std::string("world"));
  assert(single.wait_for(std::chrono::seconds(0)) == std::future_status::ready);

  std::filesystem::remove(path);
}

#if CLAIMSTONE_DB_SQLITE
void TestSqliteBackedStartup() {
  const auto db_path = (std::filesystem::temp_directory_path() / ("claimstone_startup_" + std::to_string(NowMs()) + ".db")).string();
  const auto alice   = claimstone::util::GenerateUUID();
  {
    auto db = std::make_shared<claimstone::db::sqlite::SqliteDB>(db_path);
    db->BootstrapSchema();
    claimstone::db::sqlite::SqliteIdentityDirectory players(db);
    players.Remember({alice, "alice"});
    db->Exec("INSERT INTO world(name) VALUES('world');");
    db->Exec("INSERT INTO region(world,id,alias,block_type) VALUES('world','ps1','home','EMERALD_BLOCK');");
    db->Exec("INSERT INTO region_principal(world,region_id,role,position,principal) VALUES('world','ps1',0,0,'alice');");
  }

  const auto path     = WriteConfig("sqlite", "  sqlite:\n    path: \"" + db_path + "\"\n    wal_mode: true\n");
  auto       config   = claimstone::config::ConfigLoader::LoadFromYaml(path.string());
  auto       settings = std::make_shared<claimstone::config::YamlSettingsStore>(path.string(), config);

  {
    auto app = claimstone::factory::Build(config, settings);
    assert(app.startup_migration.entries_converted == 1);

    const auto homes = app.regions->Resolve("world", "home");
    assert(homes.size() == 1);
    assert(homes[0].owners == std::vector<PrincipalRef>{ById{alice}});
  }

  std::filesystem::remove(path);
  std::filesystem::remove(db_path);
  std::filesystem::remove(db_path + "-wal");
  std::filesystem::remove(db_path + "-shm");
}
#endif

} // namespace

int main() {
  TestStartupMigratesAndServes();
  TestSecondStartupSkipsMigration();
  TestReloadRefreshesIndexAndIdentities();
#if CLAIMSTONE_DB_SQLITE
  TestSqliteBackedStartup();
#endif

  std::cout << "claimstone_integration_startup: pass\n";
  return 0;
}

#include "internal/config/config_loader.hpp"
#include "internal/config/settings_store.hpp"
#include "internal/util/errors.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "claimstone_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

std::string ReadFile(const std::filesystem::path& path) {
  std::ifstream      in(path);
  std::ostringstream content;
  content << in.rdbuf();
  return content.str();
}

const char* kFullConfig = R"(config_version: 1
logging:
  level: "debug"
database:
  sqlite:
    path: "C:\\claims\\\"quoted\"\\regions.db"
    wal_mode: true
permissions:
  namespace: "protectionstones"
identity:
  async_load: true
  push_profiles: false
migration:
  identifiers_migrated: false
catalog:
  - type: EMERALD_BLOCK
    alias: "64"
    display_name: "64x64 Protection"
    lore:
      - "Place to protect"
      - "a 64x64 area"
  - type: DIAMOND_BLOCK
  - alias: orphan
commands:
  base_command: ps
  aliases: [protectionstones, pstone]
)";

void TestFullConfigIsParsed() {
  const auto yaml_path = WriteYaml("full", kFullConfig);

  auto config = claimstone::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.config_version() == 1);
  assert(config.logging().level() == "debug");
  assert(config.database().sqlite().path() == "C:\\claims\\\"quoted\"\\regions.db");
  assert(config.database().sqlite().wal_mode());
  assert(config.permissions().namespace_() == "protectionstones");
  assert(config.identity().async_load());
  assert(!config.identity().push_profiles());
  assert(config.catalog_size() == 3);
  assert(config.commands().aliases_size() == 2);
}

void TestQuotedNumericAliasStaysString() {
  const auto yaml_path = WriteYaml("catalog", kFullConfig);

  auto       config  = claimstone::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  const auto catalog = claimstone::config::ToCatalog(config);

  // the entry without a type is dropped; a missing alias falls back to the type
  assert(catalog.size() == 2);
  assert(catalog[0].type == "EMERALD_BLOCK");
  assert(catalog[0].alias == "64");
  assert(catalog[0].display_name == "64x64 Protection");
  assert(catalog[0].lore.size() == 2);
  assert(catalog[1].type == "DIAMOND_BLOCK");
  assert(catalog[1].alias == "DIAMOND_BLOCK");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(database:
  memory: {}
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)claimstone::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const claimstone::util::InvalidConfig&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestDottedPermissionNamespaceIsRejected() {
  const auto yaml_path = WriteYaml("dotted_namespace",
                                   R"(permissions:
  namespace: "ps.claims"
)");

  bool threw = false;
  try {
    (void)claimstone::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const claimstone::util::InvalidConfig&) {
    threw = true;
  }

  assert(threw);
}

void TestMissingFileIsInvalidConfig() {
  bool threw = false;
  try {
    (void)claimstone::config::ConfigLoader::LoadFromYaml("/nonexistent/claimstone/config.yaml");
  } catch (const claimstone::util::InvalidConfig&) {
    threw = true;
  }
  assert(threw);
}

void TestMigrationGuardSurvivesReload() {
  const auto yaml_path = WriteYaml("guard", kFullConfig);

  auto config = claimstone::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  {
    claimstone::config::YamlSettingsStore store(yaml_path.string(), config);
    assert(!store.IdentifiersMigrated());
    assert(store.Catalog().Blocks().size() == 2);

    store.MarkIdentifiersMigrated();
    assert(store.IdentifiersMigrated());
  }

  auto reloaded = claimstone::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(reloaded.migration().identifiers_migrated());

  // untouched keys are kept
  assert(reloaded.database().sqlite().path() == config.database().sqlite().path());
  assert(reloaded.catalog_size() == 3);
  assert(reloaded.commands().base_command() == "ps");

  claimstone::config::YamlSettingsStore reopened(yaml_path.string(), reloaded);
  assert(reopened.IdentifiersMigrated());
  assert(!std::filesystem::exists(yaml_path.string() + ".tmp"));
  assert(ReadFile(yaml_path).find("identifiers_migrated: true") != std::string::npos);
}

} // namespace

int main() {
  TestFullConfigIsParsed();
  TestQuotedNumericAliasStaysString();
  TestUnknownFieldsAreRejected();
  TestDottedPermissionNamespaceIsRejected();
  TestMissingFileIsInvalidConfig();
  TestMigrationGuardSurvivesReload();

  std::cout << "claimstone_unit_config_loader: pass\n";
  return 0;
}

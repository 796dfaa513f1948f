#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/config/settings_store.hpp"
#include "internal/factory.hpp"
#include "internal/model/principal_ref.hpp"
#include "internal/observability/logging.hpp"
#include "internal/quota/quota_resolver.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

using claimstone::model::RegionRecord;

static void Usage() {
  std::cout << "Usage:\n"
            << "  claimstone-admin --config <config.yaml> resolve <world> <id-or-alias>\n"
            << "  claimstone-admin --config <config.yaml> alias-taken <alias>\n"
            << "  claimstone-admin --config <config.yaml> owned <world> <uuid> [--members]\n"
            << "  claimstone-admin --config <config.yaml> limits <grant>...\n"
            << "  claimstone-admin --config <config.yaml> migrate\n"
            << "  claimstone-admin --config <config.yaml> rebuild [world]\n";
}

static std::string JoinPrincipals(const std::vector<claimstone::model::PrincipalRef>& refs) {
  std::string out;
  for (const auto& ref : refs) {
    if (!out.empty()) out += ',';
    out += claimstone::model::FormatPrincipal(ref);
  }
  return out;
}

static void PrintRegion(const RegionRecord& r) {
  std::cout << r.world << '/' << r.id << " alias=" << r.alias.value_or("-") << " block=" << r.block_type.value_or("-")
            << " owners=[" << JoinPrincipals(r.owners) << "] members=[" << JoinPrincipals(r.members) << "]\n";
}

static void PrintRegions(const std::vector<RegionRecord>& regions) {
  if (regions.empty()) {
    std::cout << "no match\n";
    return;
  }
  for (const auto& r : regions) PrintRegion(r);
}

static void PrintLimit(const std::string& label, int limit) {
  std::cout << label << '=';
  if (limit == claimstone::quota::kNoLimit)
    std::cout << "unlimited\n";
  else
    std::cout << limit << '\n';
}

int main(int argc, char** argv) {
  if (argc < 4 || std::string(argv[1]) != "--config") {
    Usage();
    return 1;
  }

  const std::string              config_path = argv[2];
  const std::string              cmd         = argv[3];
  const std::vector<std::string> args(argv + 4, argv + argc);

  try {
    auto config = claimstone::config::ConfigLoader::LoadFromYaml(config_path);
    claimstone::observability::InitializeLogging(config);

    // migrate is the only command allowed to run the pass
    if (cmd != "migrate") config.mutable_migration()->set_identifiers_migrated(true);

    auto settings = std::make_shared<claimstone::config::YamlSettingsStore>(config_path, config);
    if (cmd == "migrate") {
      // the factory runs the pass when the guard is unset
      auto app = claimstone::factory::Build(config, settings);
      auto report = app.startup_migration.ran ? app.startup_migration : app.regions->RetryMigration();
      std::cout << "scanned=" << report.regions_scanned << " updated=" << report.regions_updated << " converted=" << report.entries_converted
                << " unresolved=" << report.unresolved.size() << '\n';
      for (const auto& u : report.unresolved) {
        std::cout << "  " << u.world << '/' << u.region_id << ' ' << claimstone::migration::RoleName(u.role) << ' ' << u.name << '\n';
      }
      claimstone::observability::ShutdownLogging();
      return report.unresolved.empty() ? 0 : 3;
    }

    auto app = claimstone::factory::Build(config, settings);
    auto& regions = *app.regions;

    if (cmd == "resolve" && args.size() == 2) {
      PrintRegions(regions.Resolve(args[0], args[1]));
    } else if (cmd == "alias-taken" && args.size() == 1) {
      std::cout << (regions.AliasExistsAnywhere(args[0]) ? "taken" : "free") << '\n';
    } else if (cmd == "owned" && (args.size() == 2 || args.size() == 3)) {
      const bool members = args.size() == 3 && args[2] == "--members";
      if (args.size() == 3 && !members) {
        Usage();
        return 1;
      }
      auto id = claimstone::util::TryParse(args[1]);
      if (!id) {
        std::cerr << "invalid uuid: " << args[1] << "\n";
        return 1;
      }
      PrintRegions(regions.RegionsForPrincipal(args[0], *id, members));
    } else if (cmd == "limits" && !args.empty()) {
      for (const auto& [type, limit] : regions.PerBlockLimits(args)) PrintLimit(type, limit);
      PrintLimit("global", regions.GlobalLimit(args));
    } else if (cmd == "rebuild" && args.size() <= 1) {
      regions.RebuildCaches(args.empty() ? std::nullopt : std::optional<std::string>(args[0])).wait();
      std::cout << "rebuilt\n";
    } else {
      Usage();
      return 1;
    }

    // the background identity load logs; let it finish before the logger goes
    app.identities_loaded.wait();
    claimstone::observability::ShutdownLogging();
  } catch (const claimstone::util::ScopeNotFound& e) {
    std::cerr << e.what() << "\n";
    return 4;
  } catch (const std::exception& e) {
    CLAIMSTONE_LOG_ERROR("Fatal error", {claimstone::observability::StringField("error", e.what())});
    claimstone::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}

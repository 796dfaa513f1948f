#include "settings_store.hpp"

#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <fstream>

#include "internal/config/config_loader.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace claimstone::config {

YamlSettingsStore::YamlSettingsStore(std::string path, const claimstone::runtime::config::RuntimeConfig& config)
    : path_(std::move(path)), catalog_(ToCatalog(config)), migrated_(config.migration().identifiers_migrated()) {
}

bool YamlSettingsStore::IdentifiersMigrated() const {
  std::scoped_lock lock(mutex_);
  return migrated_;
}

void YamlSettingsStore::MarkIdentifiersMigrated() {
  std::scoped_lock lock(mutex_);

  YAML::Node root;
  try {
    root = YAML::LoadFile(path_);
  } catch (const std::exception& e) {
    throw util::InvalidConfig("reload config for migration guard: " + std::string(e.what()));
  }

  root["migration"]["identifiers_migrated"] = true;

  // write-then-rename so a crash never leaves a truncated config
  const std::filesystem::path target(path_);
  auto                        staging = target;
  staging += ".tmp";
  {
    std::ofstream out(staging, std::ios::trunc);
    if (!out) {
      throw util::InvalidConfig("cannot write " + staging.string());
    }
    YAML::Emitter emitter;
    emitter << root;
    out << emitter.c_str() << '\n';
    if (!out) {
      throw util::InvalidConfig("failed writing " + staging.string());
    }
  }
  std::filesystem::rename(staging, target);

  migrated_ = true;
  CLAIMSTONE_LOG_INFO("identifier migration guard persisted", {observability::StringField("path", path_)});
}

} // namespace claimstone::config

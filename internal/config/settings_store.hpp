#pragma once

#include <memory>
#include <mutex>
#include <string>

#include "config/config.pb.h"
#include "internal/catalog/block_catalog.hpp"

namespace claimstone::config {

/*
  Persistent settings the core reads and writes: the identifier migration
  guard and the protect block catalog.
*/
class SettingsStore {
 public:
  virtual ~SettingsStore() = default;

  virtual bool IdentifiersMigrated() const = 0;

  // Sets the guard and persists it before returning.
  virtual void MarkIdentifiersMigrated() = 0;

  virtual const catalog::BlockCatalog& Catalog() const = 0;
};

/*
  SettingsStore backed by the YAML config file.

  Only migration.identifiers_migrated is written back; every other key,
  including ones this build does not know, is preserved as loaded.
*/
class YamlSettingsStore final : public SettingsStore {
 public:
  YamlSettingsStore(std::string path, const claimstone::runtime::config::RuntimeConfig& config);

  bool IdentifiersMigrated() const override;
  void MarkIdentifiersMigrated() override;

  const catalog::BlockCatalog& Catalog() const override {
    return catalog_;
  }

 private:
  std::string           path_;
  catalog::BlockCatalog catalog_;

  mutable std::mutex mutex_;
  bool               migrated_ = false;
};

} // namespace claimstone::config

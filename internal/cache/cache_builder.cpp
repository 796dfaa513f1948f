#include "cache_builder.hpp"

#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace claimstone::cache {

using observability::IntField;
using observability::StringField;

CacheBuilder::CacheBuilder(std::shared_ptr<db::Repository> repository, std::shared_ptr<index::RegionNameIndex> index,
                           std::shared_ptr<identity::IdentityCache> identities, std::shared_ptr<identity::IdentityDirectory> directory,
                           std::shared_ptr<identity::ProfileCache> profiles)
    : repository_(std::move(repository)),
      index_(std::move(index)),
      identities_(std::move(identities)),
      directory_(std::move(directory)),
      profiles_(std::move(profiles)) {
}

CacheBuilder::~CacheBuilder() {
  if (loader_.joinable()) loader_.join();
}

// ------------------------------------------------------------
// Region name index
// ------------------------------------------------------------

void CacheBuilder::RebuildIndex(const std::optional<std::string>& world) {
  std::vector<std::string> worlds;
  {
    auto tx = repository_->Begin();
    if (world) {
      if (!repository_->HasWorld(*tx, *world)) throw util::ScopeNotFound(*world);
      worlds.push_back(*world);
    } else {
      CLAIMSTONE_LOG_INFO("building region cache");
      worlds = repository_->ListWorlds(*tx);
    }
    tx->Commit();
  }

  for (const auto& name : worlds) {
    RebuildWorld(name);
  }
}

// The scan runs under the partition lock so no concurrent Add is lost.
void CacheBuilder::RebuildWorld(const std::string& world) {
  std::size_t scanned = 0;
  index_->Rebuild(world, [this, &world, &scanned] {
    auto tx       = repository_->Begin();
    auto snapshot = repository_->ListRegions(*tx, world);
    tx->Commit();
    scanned = snapshot.size();
    return snapshot;
  });
  CLAIMSTONE_LOG_DEBUG("scanned world for region cache", {StringField("world", world), IntField("regions", static_cast<std::int64_t>(scanned))});
}

// ------------------------------------------------------------
// Identity cache
// ------------------------------------------------------------

std::shared_future<void> CacheBuilder::LoadIdentities(bool async, bool push_profiles) {
  if (loader_.joinable()) loader_.join();

  CLAIMSTONE_LOG_INFO("building uuid cache", {observability::BoolField("async", async)});

  if (!async) {
    Populate(push_profiles);
    std::promise<void> done;
    done.set_value();
    return done.get_future().share();
  }

  std::promise<void> done;
  auto               future = done.get_future().share();
  loader_                   = std::thread([this, push_profiles, done = std::move(done)]() mutable {
    Populate(push_profiles);
    done.set_value();
  });
  return future;
}

void CacheBuilder::Populate(bool push_profiles) {
  if (!directory_) {
    CLAIMSTONE_LOG_WARN("no identity directory configured; uuid cache left empty");
    return;
  }

  std::vector<model::Identity> loaded;
  try {
    loaded = directory_->Enumerate();
  } catch (const util::DirectoryUnavailable& e) {
    CLAIMSTONE_LOG_WARN("identity directory unavailable; uuid cache not populated", {StringField("error", e.what())});
    return;
  } catch (const std::exception& e) {
    CLAIMSTONE_LOG_ERROR("identity directory enumeration failed", {StringField("error", e.what())});
    return;
  }

  std::vector<model::Identity> named;
  named.reserve(loaded.size());
  for (auto& identity : loaded) {
    if (identity.name.empty()) continue;
    identities_->Put(identity.id, identity.name);
    named.push_back(std::move(identity));
  }

  CLAIMSTONE_LOG_INFO("uuid cache populated", {IntField("identities", static_cast<std::int64_t>(named.size()))});

  if (!push_profiles || !profiles_) return;

  try {
    profiles_->Put(named);
  } catch (const std::exception& e) {
    CLAIMSTONE_LOG_WARN("profile cache push failed", {StringField("error", e.what())});
  }
}

} // namespace claimstone::cache

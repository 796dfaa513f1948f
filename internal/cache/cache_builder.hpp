#pragma once

#include <future>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include "internal/db/api/repository.hpp"
#include "internal/identity/identity_cache.hpp"
#include "internal/identity/identity_directory.hpp"
#include "internal/index/region_name_index.hpp"

namespace claimstone::cache {

/*
  Builds the process-lifetime caches from their external sources.

    RebuildIndex   one store scan per world -> RegionNameIndex
    LoadIdentities IdentityDirectory -> IdentityCache (-> ProfileCache)

  Identity loading can run on a background thread owned by this object;
  the returned future is the join point for anything that needs the cache
  to be complete. The destructor joins the thread.
*/
class CacheBuilder {
 public:
  CacheBuilder(std::shared_ptr<db::Repository> repository, std::shared_ptr<index::RegionNameIndex> index,
               std::shared_ptr<identity::IdentityCache> identities, std::shared_ptr<identity::IdentityDirectory> directory,
               std::shared_ptr<identity::ProfileCache> profiles = nullptr);
  ~CacheBuilder();

  CacheBuilder(const CacheBuilder&)            = delete;
  CacheBuilder& operator=(const CacheBuilder&) = delete;

  // Rebuilds every world, or only the given one (util::ScopeNotFound if the
  // store does not know it). A store failure throws util::StoreError and
  // leaves that world's index as it was.
  void RebuildIndex(const std::optional<std::string>& world = std::nullopt);

  // A directory failure is logged as a warning and leaves the cache as far
  // as it got; the future still becomes ready.
  std::shared_future<void> LoadIdentities(bool async, bool push_profiles);

 private:
  void RebuildWorld(const std::string& world);
  void Populate(bool push_profiles);

  std::shared_ptr<db::Repository>              repository_;
  std::shared_ptr<index::RegionNameIndex>      index_;
  std::shared_ptr<identity::IdentityCache>     identities_;
  std::shared_ptr<identity::IdentityDirectory> directory_;
  std::shared_ptr<identity::ProfileCache>      profiles_;

  std::thread loader_;
};

} // namespace claimstone::cache

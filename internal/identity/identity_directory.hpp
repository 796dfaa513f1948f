#pragma once

#include <vector>

#include "internal/model/identity.hpp"

namespace claimstone::identity {

/*
  Every principal the host has ever seen (offline players included).

  Enumerate() is called once per bulk load and may be slow. Implementations
  throw util::DirectoryUnavailable when the directory cannot be read.
*/
class IdentityDirectory {
 public:
  virtual ~IdentityDirectory() = default;

  virtual std::vector<model::Identity> Enumerate() = 0;
};

/*
  Shared profile cache of another subsystem (the region plugin's name
  lookups). Populated once the identity cache has been filled.
*/
class ProfileCache {
 public:
  virtual ~ProfileCache() = default;

  virtual void Put(const std::vector<model::Identity>& profiles) = 0;
};

} // namespace claimstone::identity

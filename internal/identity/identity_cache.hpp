#pragma once

#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "internal/model/identity.hpp"
#include "internal/util/uuid.hpp"

namespace claimstone::identity {

/*
  Thread-safe bidirectional UUID <-> display name cache.

  The bulk loader may write from a background thread while lookups run on
  the caller's thread. Each direction keeps only the latest mapping; entries
  are overwritten, never removed, for the lifetime of the process.
*/
class IdentityCache {
 public:
  void Put(const util::UUID& id, const std::string& name);

  std::optional<std::string> NameFor(const util::UUID& id) const;
  std::optional<util::UUID>  IdFor(const std::string& name) const;

  std::size_t Size() const;

 private:
  static std::string Key(const util::UUID& id);

  mutable std::shared_mutex                    mutex_;
  std::unordered_map<std::string, std::string> id_to_name_;
  std::unordered_map<std::string, util::UUID>  name_to_id_;
};

} // namespace claimstone::identity

#include "identity_cache.hpp"

#include <mutex>

namespace claimstone::identity {

std::string IdentityCache::Key(const util::UUID& id) {
    return util::ToString(id);
}

// ------------------------------------------------------------
// Put
// ------------------------------------------------------------

void IdentityCache::Put(const util::UUID& id, const std::string& name) {
    std::unique_lock lock(mutex_);
    id_to_name_[Key(id)] = name;
    name_to_id_[name]    = id;
}

// ------------------------------------------------------------
// Lookups
// ------------------------------------------------------------

std::optional<std::string> IdentityCache::NameFor(const util::UUID& id) const {
    std::shared_lock lock(mutex_);

    auto it = id_to_name_.find(Key(id));
    if (it == id_to_name_.end())
        return std::nullopt;

    return it->second;
}

std::optional<util::UUID> IdentityCache::IdFor(const std::string& name) const {
    std::shared_lock lock(mutex_);

    auto it = name_to_id_.find(name);
    if (it == name_to_id_.end())
        return std::nullopt;

    return it->second;
}

std::size_t IdentityCache::Size() const {
    std::shared_lock lock(mutex_);
    return id_to_name_.size();
}

} // namespace claimstone::identity

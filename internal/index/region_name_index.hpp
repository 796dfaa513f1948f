#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/model/region_record.hpp"

namespace claimstone::index {

/*
  Per-world alias -> region id index.

  Consistency model:
  - The region store is authoritative; this index is a cache over it and is
    never told about out-of-band changes.
  - An alias list may hold stale ids between a store change and the next
    lookup of that alias. Collect() re-checks every id and drops the stale
    ones for good, so after a lookup returns the list holds no id that was
    stale at lookup time.
  - Aliases are not unique; ids keep insertion order.
  - Rebuild() replaces a world's partition wholesale.

  Each world has its own mutex. Rebuild, Add, Remove and Collect on the same
  world are serialized; the fetch callback of Collect runs under that lock
  and must read a store view taken after the lock was acquired, otherwise an
  id added just before the lookup could be dropped while still live. A fetch
  that throws leaves the list untouched from that id on.
*/
class RegionNameIndex {
 public:
  // Returns the live record for an id, or nullopt if the id is stale.
  using Fetch = std::function<std::optional<model::RegionRecord>(const std::string& id)>;

  // Reads the world's regions; called under the partition lock.
  using Load = std::function<std::vector<model::RegionRecord>()>;

  void Rebuild(const std::string& world, const std::vector<model::RegionRecord>& snapshot);
  // Same, with the snapshot read under the lock. If load throws the partition
  // keeps its previous content.
  void Rebuild(const std::string& world, const Load& load);

  void Add(const std::string& world, const std::string& alias, const std::string& id);
  void Remove(const std::string& world, const std::string& alias, const std::string& id);

  // Prune-then-return for one alias. Survivors keep their order.
  std::vector<model::RegionRecord> Collect(const std::string& world, const std::string& alias, const Fetch& fetch);

  // Current ids for an alias, stale ones included.
  std::vector<std::string> Ids(const std::string& world, const std::string& alias) const;

  // alias -> ids for a world, for inspection and comparison.
  std::unordered_map<std::string, std::vector<std::string>> Snapshot(const std::string& world) const;

  std::vector<std::string> Worlds() const;

 private:
  struct Partition {
    mutable std::mutex                                        mutex;
    std::unordered_map<std::string, std::vector<std::string>> by_alias;
  };

  std::shared_ptr<Partition> Find(const std::string& world) const;
  std::shared_ptr<Partition> FindOrCreate(const std::string& world);

  mutable std::shared_mutex                                   partitions_mutex_;
  std::unordered_map<std::string, std::shared_ptr<Partition>> partitions_;
};

} // namespace claimstone::index

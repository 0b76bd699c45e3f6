#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "absl/container/btree_set.h"
#include "absl/container/flat_hash_map.h"
#include "ripple/common/diagnostic.hpp"
#include "ripple/common/ids.hpp"
#include "ripple/runtime/graph_algorithms.hpp"
#include "ripple/storage/address.hpp"
#include "ripple/storage/reactivity_log.hpp"
#include "ripple/storage/tier_manager.hpp"
#include "ripple/storage/transaction.hpp"

namespace ripple::runtime {

struct SubscriptionLimits {
  // Addresses (reads plus writes, after compaction) one action may hold.
  uint32_t max_per_action = 4096;
  // Addresses across all actions.
  uint32_t max_total = 1U << 20;
};

// Bipartite index between actions and the addresses they touch.
//
// Forward: action -> its compacted log and everything it might write.
// Reverse: entity -> actions reading it / actions writing it.
// Derived: dependents (readers of what an action writes) and the inverse
// dependencies, kept in sync on every (re)subscribe.
class DependencyGraph {
 public:
  explicit DependencyGraph(SubscriptionLimits limits = {}) : limits_(limits) {
  }

  // Runs `fn` once against `tx` and returns what it touched.
  template <typename Fn>
  static auto Capture(Fn&& fn, storage::Transaction& tx)
      -> storage::ReactivityLog {
    fn(tx);
    return tx.Log();
  }

  // Replaces the action's log. The might-write set only grows: it keeps every
  // write the action has ever declared or performed.
  auto Subscribe(ActionId id, const storage::ReactivityLog& log)
      -> Result<void>;
  void Unsubscribe(ActionId id);

  [[nodiscard]] auto Contains(ActionId id) const -> bool {
    return nodes_.contains(id);
  }
  [[nodiscard]] auto Size() const -> size_t {
    return nodes_.size();
  }

  // Compacted reads/writes of the latest subscription. Unknown ids throw
  // InternalError.
  [[nodiscard]] auto GetLog(ActionId id) const
      -> const storage::ReactivityLog&;
  [[nodiscard]] auto MightWrite(ActionId id) const
      -> const std::vector<storage::Address>&;

  // Sorted by id.
  [[nodiscard]] auto Dependents(ActionId id) const -> std::vector<ActionId>;
  [[nodiscard]] auto Dependencies(ActionId id) const -> std::vector<ActionId>;

  // Actions reading the changed entity at a path whose value differs
  // between `before` and `after`. Sorted by id.
  [[nodiscard]] auto Triggered(const storage::StorageChange& change) const
      -> std::vector<ActionId>;

  // Dependent edges restricted to `nodes`.
  [[nodiscard]] auto EdgesWithin(const std::vector<ActionId>& nodes) const
      -> EdgeMap;

  [[nodiscard]] auto TotalSubscriptions() const -> size_t {
    return total_subscriptions_;
  }

 private:
  struct Node {
    storage::ReactivityLog log;
    std::vector<storage::Address> might_write;
    absl::btree_set<EntityId> read_entities;
    absl::btree_set<EntityId> write_entities;
    absl::btree_set<ActionId> dependents;
    absl::btree_set<ActionId> dependencies;
  };

  auto Intern(const storage::EntityKey& key) -> EntityId;
  [[nodiscard]] auto Lookup(const storage::EntityKey& key) const
      -> const EntityId*;
  [[nodiscard]] auto GetNode(ActionId id) const -> const Node&;
  void Unlink(ActionId id, Node& node);
  void Link(ActionId id, Node& node);
  static auto Feeds(const Node& writer, const Node& reader) -> bool;

  SubscriptionLimits limits_;
  size_t total_subscriptions_ = 0;

  absl::flat_hash_map<ActionId, Node> nodes_;
  absl::flat_hash_map<storage::EntityKey, EntityId> entity_ids_;
  absl::flat_hash_map<EntityId, absl::btree_set<ActionId>> readers_;
  absl::flat_hash_map<EntityId, absl::btree_set<ActionId>> writers_;
};

}  // namespace ripple::runtime

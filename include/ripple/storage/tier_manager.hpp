#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include "absl/container/btree_map.h"
#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "ripple/common/diagnostic.hpp"
#include "ripple/storage/address.hpp"
#include "ripple/storage/cache.hpp"
#include "ripple/storage/fact.hpp"
#include "ripple/storage/remote_store.hpp"
#include "ripple/storage/value.hpp"

namespace ripple::storage {

enum class ChangeKind : uint8_t {
  kCommit,     // Local write staged into the nursery
  kRevert,     // Rejected local write rolled back
  kIntegrate,  // Remote update applied to the heap
};

// Visible-value change of one entity, as seen by readers.
struct StorageChange {
  ChangeKind kind;
  EntityKey entity;
  std::optional<Value> before;
  std::optional<Value> after;
};

using ChangeListener = std::function<void(const StorageChange&)>;
using ListenerId = uint32_t;

// Layered replica of the remote store.
//
//   Nursery  local facts awaiting confirmation (shadows everything)
//   Heap     confirmed facts: promoted commits and remote updates
//   Cache    persisted confirmed facts, loaded into the heap on demand
//
// Reads resolve Nursery > Heap > Cache > remote pull. Remote data never
// enters the nursery.
class TierManager {
 public:
  explicit TierManager(RemoteStore& remote, FactCache* cache = nullptr);
  ~TierManager();

  TierManager(const TierManager&) = delete;
  auto operator=(const TierManager&) -> TierManager& = delete;
  TierManager(TierManager&&) = delete;
  auto operator=(TierManager&&) -> TierManager& = delete;

  // Visible fact for `key`, pulling from the remote on first access.
  auto Read(const EntityKey& key) -> Result<std::optional<Fact>>;

  auto Get(const Address& address) -> Result<std::optional<Value>>;

  // Single-write transaction. `on_settled` runs once the remote answers.
  auto Set(const Address& address, Value value, CommitCallback on_settled = {})
      -> Result<void>;

  // Write path of a committing transaction: stages `facts` in the nursery,
  // publishes the change, and sends them to the remote as one commit.
  void Stage(std::vector<Fact> facts, CommitCallback on_settled);

  // Applies a remote fact (pull result or subscription push).
  void Integrate(const Fact& fact);

  // Drops nursery, pending bookkeeping and heap, e.g. after a reconnect.
  // Listeners and the cache stay.
  void Reset();

  auto AddListener(ChangeListener listener) -> ListenerId;
  void RemoveListener(ListenerId id);

  [[nodiscard]] auto NurseryFact(const EntityKey& key) const
      -> std::optional<Fact>;
  [[nodiscard]] auto HeapFact(const EntityKey& key) const
      -> std::optional<Fact>;
  [[nodiscard]] auto PendingCount() const -> size_t;

 private:
  void Confirm(const std::vector<Fact>& facts, const CommitReceipt& receipt);
  void Reject(const std::vector<Fact>& facts, const CommitConflict& conflict);
  void PutHeap(const Fact& fact, bool force);
  void EnsureRemoteSubscription(const EntityKey& key);
  [[nodiscard]] auto VisibleValue(const EntityKey& key) const
      -> std::optional<Value>;
  void Publish(
      ChangeKind kind, const EntityKey& key, std::optional<Value> before);

  RemoteStore& remote_;
  FactCache* cache_;

  absl::flat_hash_map<EntityKey, Fact> nursery_;
  absl::flat_hash_map<EntityKey, Fact> heap_;
  // Refs of staged-but-unconfirmed facts per entity, oldest first.
  absl::flat_hash_map<EntityKey, std::vector<FactRef>> pending_;
  // Entities the remote reported as never written; not pulled again.
  absl::flat_hash_set<EntityKey> unclaimed_;
  absl::flat_hash_map<EntityKey, SubscriptionId> remote_subscriptions_;

  absl::btree_map<ListenerId, ChangeListener> listeners_;
  ListenerId next_listener_ = 0;

  // Commits still in flight at the remote check this before touching the
  // tiers; it expires with the manager.
  std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

}  // namespace ripple::storage

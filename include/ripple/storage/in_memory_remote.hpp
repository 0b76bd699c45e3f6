#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "ripple/storage/remote_store.hpp"

namespace ripple::storage {

// In-process authoritative store. Holds the latest fact per entity and
// accepts a commit only when every fact's cause matches the current head.
class InMemoryRemoteStore : public RemoteStore {
 public:
  enum class CompletionMode : uint8_t {
    kImmediate,  // Commit() settles before returning
    kDeferred,   // Commit() is held until SettlePending()
  };

  explicit InMemoryRemoteStore(
      CompletionMode mode = CompletionMode::kImmediate)
      : mode_(mode) {
  }

  auto Pull(const EntityKey& key) -> Result<std::optional<Fact>> override;
  auto Subscribe(const EntityKey& key, FactCallback on_change)
      -> SubscriptionId override;
  void Unsubscribe(SubscriptionId id) override;
  void Commit(std::vector<Fact> facts, CommitCallback on_done) override;

  // Settles held commits in arrival order. Returns how many were settled.
  auto SettlePending() -> size_t;

  // Simulates a write from another client: appends a fact on top of the
  // current head and notifies subscribers.
  auto ApplyExternal(const EntityKey& key, std::optional<Value> value) -> Fact;

  // The next commit touching `key` is rejected, whatever its cause.
  void InjectConflict(const EntityKey& key);

  void SetCompletionMode(CompletionMode mode) {
    mode_ = mode;
  }

  // Makes Pull() fail with a store error, for exercising error paths.
  void SetPullFailure(bool fail) {
    fail_pulls_ = fail;
  }

  [[nodiscard]] auto Head(const EntityKey& key) const -> std::optional<Fact>;
  [[nodiscard]] auto PendingCommits() const -> size_t {
    return held_.size();
  }
  [[nodiscard]] auto CommitCount() const -> size_t {
    return commit_count_;
  }
  [[nodiscard]] auto PullCount() const -> size_t {
    return pull_count_;
  }

 private:
  struct HeldCommit {
    std::vector<Fact> facts;
    CommitCallback on_done;
  };

  void Settle(HeldCommit commit);
  void Notify(const Fact& fact);

  CompletionMode mode_;
  bool fail_pulls_ = false;
  int64_t next_since_ = 1;
  SubscriptionId next_subscription_ = 1;
  size_t commit_count_ = 0;
  size_t pull_count_ = 0;

  absl::flat_hash_map<EntityKey, Fact> heads_;
  absl::flat_hash_set<EntityKey> injected_conflicts_;
  std::deque<HeldCommit> held_;

  struct Subscriber {
    EntityKey key;
    FactCallback callback;
  };
  absl::flat_hash_map<SubscriptionId, Subscriber> subscribers_;
};

}  // namespace ripple::storage

#include "ripple/storage/tier_manager.hpp"

#include <algorithm>
#include <cstddef>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "absl/container/btree_map.h"
#include "ripple/common/diagnostic.hpp"
#include "ripple/common/log.hpp"
#include "ripple/storage/transaction.hpp"

namespace ripple::storage {

TierManager::TierManager(RemoteStore& remote, FactCache* cache)
    : remote_(remote), cache_(cache) {
}

TierManager::~TierManager() {
  for (const auto& [key, id] : remote_subscriptions_) {
    remote_.Unsubscribe(id);
  }
}

auto TierManager::Read(const EntityKey& key) -> Result<std::optional<Fact>> {
  if (auto it = nursery_.find(key); it != nursery_.end()) {
    return it->second;
  }
  if (auto it = heap_.find(key); it != heap_.end()) {
    return it->second;
  }
  if (unclaimed_.contains(key)) {
    return std::nullopt;
  }

  if (cache_ != nullptr) {
    if (auto cached = cache_->Load(key)) {
      heap_.insert_or_assign(key, *cached);
      EnsureRemoteSubscription(key);
      return cached;
    }
  }

  auto pulled = remote_.Pull(key);
  if (!pulled) {
    return std::unexpected(
        std::move(pulled.error())
            .WithNote("while loading " + ToString(key)));
  }
  EnsureRemoteSubscription(key);
  if (!*pulled) {
    unclaimed_.insert(key);
    return std::nullopt;
  }
  PutHeap(**pulled, false);
  return *pulled;
}

auto TierManager::Get(const Address& address)
    -> Result<std::optional<Value>> {
  auto fact = Read(address.Key());
  if (!fact) {
    return std::unexpected(fact.error());
  }
  if (!*fact) {
    return std::nullopt;
  }
  return GetAtPath((*fact)->is, address.path);
}

auto TierManager::Set(
    const Address& address, Value value, CommitCallback on_settled)
    -> Result<void> {
  Transaction tx(*this);
  try {
    tx.Write(address, std::move(value));
  } catch (const DiagnosticException& e) {
    tx.Abort();
    return std::unexpected(e.GetDiagnostic());
  }
  return tx.Commit(std::move(on_settled));
}

void TierManager::Stage(std::vector<Fact> facts, CommitCallback on_settled) {
  // Every fact becomes visible before any listener runs, so listeners never
  // observe half of a transaction.
  std::vector<std::optional<Value>> before;
  before.reserve(facts.size());
  for (const auto& fact : facts) {
    before.push_back(VisibleValue(fact.of));
    nursery_.insert_or_assign(fact.of, fact);
    pending_[fact.of].push_back(fact.Ref());
  }
  for (size_t i = 0; i < facts.size(); ++i) {
    Publish(ChangeKind::kCommit, facts[i].of, std::move(before[i]));
  }

  std::vector<Fact> sent = facts;
  std::weak_ptr<bool> alive = alive_;
  remote_.Commit(
      std::move(sent),
      [this, alive, facts = std::move(facts),
       on_settled = std::move(on_settled)](const CommitOutcome& outcome) {
        if (alive.expired()) {
          return;
        }
        if (outcome) {
          Confirm(facts, *outcome);
        } else {
          Reject(facts, outcome.error());
        }
        if (on_settled) {
          on_settled(outcome);
        }
      });
}

void TierManager::Confirm(
    const std::vector<Fact>& facts, const CommitReceipt& receipt) {
  for (const auto& fact : facts) {
    FactRef ref = fact.Ref();
    if (auto it = pending_.find(fact.of); it != pending_.end()) {
      std::erase(it->second, ref);
      if (it->second.empty()) {
        pending_.erase(it);
      }
    }

    std::optional<Value> before = VisibleValue(fact.of);
    Fact confirmed = fact;
    confirmed.since = receipt.since;
    PutHeap(confirmed, false);
    unclaimed_.erase(fact.of);

    // A newer local fact built on this one keeps shadowing the heap.
    if (auto it = nursery_.find(fact.of);
        it != nursery_.end() && it->second.Ref() == ref) {
      nursery_.erase(it);
    }
    Publish(ChangeKind::kCommit, fact.of, std::move(before));
  }
}

void TierManager::Reject(
    const std::vector<Fact>& facts, const CommitConflict& conflict) {
  absl::btree_map<EntityKey, std::optional<Value>> before;
  for (const auto& fact : facts) {
    before.try_emplace(fact.of, VisibleValue(fact.of));
  }
  before.try_emplace(conflict.entity, VisibleValue(conflict.entity));

  for (const auto& fact : facts) {
    nursery_.erase(fact.of);
    pending_.erase(fact.of);
  }
  if (conflict.actual) {
    PutHeap(*conflict.actual, true);
    unclaimed_.erase(conflict.entity);
  }
  GetLogger()->debug(
      "commit rejected on {}; rolled back {} fact(s)",
      ToString(conflict.entity), facts.size());

  for (auto& [key, value] : before) {
    Publish(ChangeKind::kRevert, key, std::move(value));
  }
}

void TierManager::Integrate(const Fact& fact) {
  unclaimed_.erase(fact.of);
  if (auto it = heap_.find(fact.of); it != heap_.end()) {
    if (it->second == fact) {
      it->second.since = std::max(it->second.since, fact.since);
      return;
    }
    if (it->second.since > fact.since) {
      return;
    }
  }

  std::optional<Value> before = VisibleValue(fact.of);
  PutHeap(fact, false);

  // The nursery entry is dropped only when the remote already holds the same
  // value. Otherwise it is either built on this fact and still in flight, or
  // doomed to conflict; both cases keep shadowing until the commit settles.
  if (auto it = nursery_.find(fact.of);
      it != nursery_.end() && it->second.is == fact.is) {
    nursery_.erase(it);
  }
  Publish(ChangeKind::kIntegrate, fact.of, std::move(before));
}

void TierManager::Reset() {
  nursery_.clear();
  pending_.clear();
  heap_.clear();
  unclaimed_.clear();
  for (const auto& [key, id] : remote_subscriptions_) {
    remote_.Unsubscribe(id);
  }
  remote_subscriptions_.clear();
}

auto TierManager::AddListener(ChangeListener listener) -> ListenerId {
  ListenerId id = next_listener_++;
  listeners_.emplace(id, std::move(listener));
  return id;
}

void TierManager::RemoveListener(ListenerId id) {
  listeners_.erase(id);
}

auto TierManager::NurseryFact(const EntityKey& key) const
    -> std::optional<Fact> {
  auto it = nursery_.find(key);
  if (it == nursery_.end()) {
    return std::nullopt;
  }
  return it->second;
}

auto TierManager::HeapFact(const EntityKey& key) const -> std::optional<Fact> {
  auto it = heap_.find(key);
  if (it == heap_.end()) {
    return std::nullopt;
  }
  return it->second;
}

auto TierManager::PendingCount() const -> size_t {
  size_t count = 0;
  for (const auto& [key, refs] : pending_) {
    count += refs.size();
  }
  return count;
}

void TierManager::PutHeap(const Fact& fact, bool force) {
  if (!force) {
    auto it = heap_.find(fact.of);
    if (it != heap_.end() && it->second.since > fact.since) {
      return;
    }
  }
  heap_.insert_or_assign(fact.of, fact);
  if (cache_ != nullptr && fact.since != kUnconfirmed) {
    if (auto stored = cache_->Store(fact); !stored) {
      GetLogger()->warn(
          "cache write-through failed: {}",
          FormatDiagnostic(stored.error()));
    }
  }
}

void TierManager::EnsureRemoteSubscription(const EntityKey& key) {
  if (remote_subscriptions_.contains(key)) {
    return;
  }
  SubscriptionId id =
      remote_.Subscribe(key, [this](const Fact& fact) { Integrate(fact); });
  remote_subscriptions_.emplace(key, id);
}

auto TierManager::VisibleValue(const EntityKey& key) const
    -> std::optional<Value> {
  if (auto it = nursery_.find(key); it != nursery_.end()) {
    return it->second.is;
  }
  if (auto it = heap_.find(key); it != heap_.end()) {
    return it->second.is;
  }
  return std::nullopt;
}

void TierManager::Publish(
    ChangeKind kind, const EntityKey& key, std::optional<Value> before) {
  std::optional<Value> after = VisibleValue(key);
  if (before == after) {
    return;
  }
  StorageChange change{
      .kind = kind,
      .entity = key,
      .before = std::move(before),
      .after = std::move(after),
  };
  // Listeners may add or remove listeners; iterate over a snapshot of ids.
  std::vector<ListenerId> ids;
  ids.reserve(listeners_.size());
  for (const auto& [id, listener] : listeners_) {
    ids.push_back(id);
  }
  for (ListenerId id : ids) {
    auto it = listeners_.find(id);
    if (it != listeners_.end()) {
      ChangeListener listener = it->second;
      listener(change);
    }
  }
}

}  // namespace ripple::storage

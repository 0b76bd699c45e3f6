#include "ripple/storage/in_memory_remote.hpp"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

#include <fmt/format.h>

namespace ripple::storage {

auto InMemoryRemoteStore::Pull(const EntityKey& key)
    -> Result<std::optional<Fact>> {
  ++pull_count_;
  if (fail_pulls_) {
    return std::unexpected(
        Diagnostic::Error(
            ErrorCode::kStoreError,
            fmt::format("remote pull of {} failed", ToString(key))));
  }
  return Head(key);
}

auto InMemoryRemoteStore::Subscribe(const EntityKey& key, FactCallback on_change)
    -> SubscriptionId {
  SubscriptionId id = next_subscription_++;
  subscribers_.emplace(
      id, Subscriber{.key = key, .callback = std::move(on_change)});
  return id;
}

void InMemoryRemoteStore::Unsubscribe(SubscriptionId id) {
  subscribers_.erase(id);
}

void InMemoryRemoteStore::Commit(
    std::vector<Fact> facts, CommitCallback on_done) {
  HeldCommit commit{.facts = std::move(facts), .on_done = std::move(on_done)};
  if (mode_ == CompletionMode::kDeferred) {
    held_.push_back(std::move(commit));
    return;
  }
  Settle(std::move(commit));
}

auto InMemoryRemoteStore::SettlePending() -> size_t {
  size_t settled = 0;
  while (!held_.empty()) {
    HeldCommit commit = std::move(held_.front());
    held_.pop_front();
    Settle(std::move(commit));
    ++settled;
  }
  return settled;
}

void InMemoryRemoteStore::Settle(HeldCommit commit) {
  ++commit_count_;

  // Validate every fact before applying any of them.
  for (const auto& fact : commit.facts) {
    auto head = Head(fact.of);
    bool injected = injected_conflicts_.erase(fact.of) > 0;
    // A fact already at the head is an idempotent replay, not a conflict.
    bool already_applied = head && *head == fact;
    if (injected || (!already_applied && RefOf(head) != fact.cause)) {
      if (commit.on_done) {
        commit.on_done(
            std::unexpected(
                CommitConflict{
                    .entity = fact.of,
                    .expected = fact.cause,
                    .actual = head,
                }));
      }
      return;
    }
  }

  int64_t since = next_since_++;
  std::vector<Fact> applied;
  applied.reserve(commit.facts.size());
  for (auto& fact : commit.facts) {
    fact.since = since;
    heads_.insert_or_assign(fact.of, fact);
    applied.push_back(fact);
  }
  if (commit.on_done) {
    commit.on_done(CommitReceipt{.since = since});
  }
  for (const auto& fact : applied) {
    Notify(fact);
  }
}

auto InMemoryRemoteStore::ApplyExternal(
    const EntityKey& key, std::optional<Value> value) -> Fact {
  Fact fact = MakeFact(key, std::move(value), RefOf(Head(key)));
  fact.since = next_since_++;
  heads_.insert_or_assign(key, fact);
  Notify(fact);
  return fact;
}

void InMemoryRemoteStore::InjectConflict(const EntityKey& key) {
  injected_conflicts_.insert(key);
}

auto InMemoryRemoteStore::Head(const EntityKey& key) const
    -> std::optional<Fact> {
  auto it = heads_.find(key);
  if (it == heads_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void InMemoryRemoteStore::Notify(const Fact& fact) {
  // Callbacks may subscribe or unsubscribe; snapshot the targets first.
  std::vector<SubscriptionId> targets;
  for (const auto& [id, sub] : subscribers_) {
    if (sub.key == fact.of) {
      targets.push_back(id);
    }
  }
  std::ranges::sort(targets);
  for (SubscriptionId id : targets) {
    auto it = subscribers_.find(id);
    if (it != subscribers_.end()) {
      FactCallback callback = it->second.callback;
      callback(fact);
    }
  }
}

}  // namespace ripple::storage

#pragma once

#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <vector>

#include "ripple/common/diagnostic.hpp"
#include "ripple/storage/address.hpp"
#include "ripple/storage/fact.hpp"

namespace ripple::storage {

struct CommitReceipt {
  // Sequence number the remote assigned to the commit.
  int64_t since = kUnconfirmed;
};

// The remote refused a commit because `entity` no longer matched the cause
// the commit was built on.
struct CommitConflict {
  EntityKey entity;
  std::optional<FactRef> expected;
  // Current authoritative fact, when the remote reports it.
  std::optional<Fact> actual;
};

using CommitOutcome = std::expected<CommitReceipt, CommitConflict>;
using CommitCallback = std::function<void(const CommitOutcome&)>;
using FactCallback = std::function<void(const Fact&)>;
using SubscriptionId = uint64_t;

// Boundary to the authoritative store. Implementations may complete commits
// synchronously or from a later event-loop task; callers must handle both.
class RemoteStore {
 public:
  virtual ~RemoteStore() = default;

  // Latest fact for `key`, or nullopt when the entity was never written.
  virtual auto Pull(const EntityKey& key) -> Result<std::optional<Fact>> = 0;

  // `on_change` sees every fact accepted for `key` after this call.
  virtual auto Subscribe(const EntityKey& key, FactCallback on_change)
      -> SubscriptionId = 0;
  virtual void Unsubscribe(SubscriptionId id) = 0;

  // All-or-nothing compare-and-swap of `facts` against their causes.
  virtual void Commit(std::vector<Fact> facts, CommitCallback on_done) = 0;
};

}  // namespace ripple::storage

#pragma once

#include <optional>
#include <vector>

#include "absl/container/btree_map.h"
#include "absl/container/flat_hash_set.h"
#include "ripple/common/diagnostic.hpp"
#include "ripple/storage/address.hpp"
#include "ripple/storage/fact.hpp"
#include "ripple/storage/reactivity_log.hpp"
#include "ripple/storage/remote_store.hpp"
#include "ripple/storage/tier_manager.hpp"
#include "ripple/storage/value.hpp"

namespace ripple::storage {

// Buffers writes against a snapshot of each touched entity and records the
// exact addresses read and written. Commit is all-or-nothing.
//
// The first access to an entity pins its visible fact; that fact's ref is
// the cause every new fact for the entity is built on.
class Transaction {
 public:
  explicit Transaction(TierManager& tiers) : tiers_(tiers) {
  }

  // Throws DiagnosticException when the entity cannot be loaded.
  auto Read(const Address& address) -> std::optional<Value>;

  // Typed read; `fallback` when the address is absent or null.
  template <typename T>
  auto ReadOr(const Address& address, T fallback) -> T {
    auto value = Read(address);
    if (!value || value->is_null()) {
      return fallback;
    }
    return value->template get<T>();
  }

  void Write(const Address& address, Value value);

  [[nodiscard]] auto Log() const -> ReactivityLog;

  // Local compare-and-swap of every written entity against its pinned cause,
  // then a single remote commit. Writes that leave an entity unchanged are
  // dropped. A local mismatch fails with kCommitConflict and stages nothing.
  // `on_settled` runs when the remote answers (immediately if nothing
  // changed).
  auto Commit(CommitCallback on_settled = {}) -> Result<void>;

  void Abort();

  [[nodiscard]] auto IsFinished() const -> bool {
    return finished_;
  }

 private:
  struct EntityState {
    std::optional<Fact> snapshot;
    std::optional<Value> working;
    bool written = false;
  };

  auto Touch(const EntityKey& key) -> EntityState&;
  void CheckOpen(const char* op) const;

  TierManager& tiers_;
  absl::btree_map<EntityKey, EntityState> entities_;
  std::vector<Address> reads_;
  std::vector<Address> writes_;
  absl::flat_hash_set<Address> read_set_;
  absl::flat_hash_set<Address> write_set_;
  bool finished_ = false;
};

}  // namespace ripple::storage

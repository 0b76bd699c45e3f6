#pragma once

#include <compare>
#include <cstdint>
#include <limits>
#include <utility>

namespace ripple {

// Stable handle for a subscribed action. Ids are allocated monotonically and
// never reused, so a stale id cannot alias a newer action.
struct ActionId {
  static constexpr uint32_t kInvalid = std::numeric_limits<uint32_t>::max();

  uint32_t value = kInvalid;

  auto operator==(const ActionId&) const -> bool = default;
  auto operator<=>(const ActionId&) const = default;

  explicit operator bool() const {
    return value != kInvalid;
  }

  template <typename H>
  friend auto AbslHashValue(H h, ActionId id) -> H {
    return H::combine(std::move(h), id.value);
  }
};

// Interned (space, entity) pair. Only meaningful within one DependencyGraph.
struct EntityId {
  uint32_t value = 0;

  auto operator==(const EntityId&) const -> bool = default;
  auto operator<=>(const EntityId&) const = default;

  template <typename H>
  friend auto AbslHashValue(H h, EntityId id) -> H {
    return H::combine(std::move(h), id.value);
  }
};

}  // namespace ripple

#pragma once

#include <compare>
#include <string>
#include <utility>
#include <vector>

namespace ripple::storage {

// A JSON path into an entity's value. Numeric steps index arrays.
using Path = std::vector<std::string>;

// (space, entity): the unit that facts version and commits swap.
struct EntityKey {
  std::string space;
  std::string entity;

  auto operator==(const EntityKey&) const -> bool = default;
  auto operator<=>(const EntityKey&) const = default;

  template <typename H>
  friend auto AbslHashValue(H h, const EntityKey& key) -> H {
    return H::combine(std::move(h), key.space, key.entity);
  }
};

// Smallest unit of addressable state.
struct Address {
  std::string space;
  std::string entity;
  Path path;

  [[nodiscard]] auto Key() const -> EntityKey {
    return EntityKey{.space = space, .entity = entity};
  }

  auto operator==(const Address&) const -> bool = default;
  auto operator<=>(const Address&) const = default;

  template <typename H>
  friend auto AbslHashValue(H h, const Address& addr) -> H {
    return H::combine(std::move(h), addr.space, addr.entity, addr.path);
  }
};

auto IsPathPrefix(const Path& prefix, const Path& path) -> bool;

// Same entity and one path is a prefix of the other.
auto Overlaps(const Address& a, const Address& b) -> bool;

// True if any address in `lhs` overlaps any address in `rhs`.
auto AnyOverlap(const std::vector<Address>& lhs, const std::vector<Address>& rhs)
    -> bool;

// Sorts addresses and drops every address already covered by a kept prefix
// on the same entity. The result is canonical for a given input set.
auto SortAndCompact(std::vector<Address> addresses) -> std::vector<Address>;

auto ToString(const EntityKey& key) -> std::string;
auto ToString(const Address& addr) -> std::string;

}  // namespace ripple::storage

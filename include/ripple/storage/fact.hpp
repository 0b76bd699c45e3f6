#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

#include "ripple/common/diagnostic.hpp"
#include "ripple/storage/address.hpp"
#include "ripple/storage/value.hpp"

namespace ripple::storage {

inline constexpr const char* kJsonFactType = "application/json";

// Content hash of a fact. Two facts with the same type, entity, value and
// cause have the same ref, independent of when they were confirmed.
struct FactRef {
  std::string hash;

  auto operator==(const FactRef&) const -> bool = default;
  auto operator<=>(const FactRef&) const = default;

  template <typename H>
  friend auto AbslHashValue(H h, const FactRef& ref) -> H {
    return H::combine(std::move(h), ref.hash);
  }
};

// Sequence number of a fact that the remote store has not confirmed yet.
inline constexpr int64_t kUnconfirmed = -1;

// A versioned assertion about an entity. `is == nullopt` is a retraction.
// `cause` is the ref of the fact this one supersedes, so the facts of one
// entity form a hash chain.
struct Fact {
  std::string type = kJsonFactType;
  EntityKey of;
  std::optional<Value> is;
  std::optional<FactRef> cause;
  int64_t since = kUnconfirmed;

  [[nodiscard]] auto Ref() const -> FactRef;

  // Facts compare by content; `since` is bookkeeping.
  auto operator==(const Fact& other) const -> bool {
    return type == other.type && of == other.of && is == other.is &&
           cause == other.cause;
  }
};

auto MakeFact(
    EntityKey of, std::optional<Value> is, std::optional<FactRef> cause)
    -> Fact;

// Ref of an optional fact; nullopt stands for "no fact yet".
auto RefOf(const std::optional<Fact>& fact) -> std::optional<FactRef>;

auto FactToJson(const Fact& fact) -> Value;
auto FactFromJson(const Value& json) -> Result<Fact>;

}  // namespace ripple::storage

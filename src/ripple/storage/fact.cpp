#include "ripple/storage/fact.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

namespace ripple::storage {

namespace {

constexpr uint64_t kFnvOffset = 14695981039346656037ULL;
constexpr uint64_t kFnvPrime = 1099511628211ULL;

void HashField(uint64_t& h, std::string_view bytes) {
  for (char c : bytes) {
    h ^= static_cast<uint8_t>(c);
    h *= kFnvPrime;
  }
  // Field separator so ("ab", "c") and ("a", "bc") differ.
  h ^= 0xffU;
  h *= kFnvPrime;
}

}  // namespace

auto Fact::Ref() const -> FactRef {
  uint64_t h = kFnvOffset;
  HashField(h, type);
  HashField(h, of.space);
  HashField(h, of.entity);
  // dump() of nlohmann::json is canonical: object keys are ordered.
  HashField(h, is ? is->dump() : std::string("~"));
  HashField(h, cause ? cause->hash : std::string());
  return FactRef{.hash = fmt::format("{:016x}", h)};
}

auto MakeFact(
    EntityKey of, std::optional<Value> is, std::optional<FactRef> cause)
    -> Fact {
  return Fact{
      .type = kJsonFactType,
      .of = std::move(of),
      .is = std::move(is),
      .cause = std::move(cause),
      .since = kUnconfirmed,
  };
}

auto RefOf(const std::optional<Fact>& fact) -> std::optional<FactRef> {
  if (!fact) {
    return std::nullopt;
  }
  return fact->Ref();
}

auto FactToJson(const Fact& fact) -> Value {
  Value json = {
      {"type", fact.type},
      {"space", fact.of.space},
      {"entity", fact.of.entity},
      {"since", fact.since},
  };
  if (fact.is) {
    json["is"] = *fact.is;
  }
  if (fact.cause) {
    json["cause"] = fact.cause->hash;
  }
  return json;
}

auto FactFromJson(const Value& json) -> Result<Fact> {
  if (!json.is_object() || !json.contains("space") ||
      !json.contains("entity") || !json["space"].is_string() ||
      !json["entity"].is_string()) {
    return std::unexpected(
        Diagnostic::Error(
            ErrorCode::kStoreError,
            fmt::format("malformed fact record: {}", json.dump())));
  }
  Fact fact;
  fact.type = json.value("type", std::string(kJsonFactType));
  fact.of = EntityKey{
      .space = json["space"].get<std::string>(),
      .entity = json["entity"].get<std::string>(),
  };
  if (auto it = json.find("is"); it != json.end()) {
    fact.is = *it;
  }
  if (auto it = json.find("cause"); it != json.end() && it->is_string()) {
    fact.cause = FactRef{.hash = it->get<std::string>()};
  }
  fact.since = json.value("since", kUnconfirmed);
  return fact;
}

}  // namespace ripple::storage

#include "ripple/storage/transaction.hpp"

#include <optional>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "ripple/common/internal_error.hpp"

namespace ripple::storage {

auto Transaction::Read(const Address& address) -> std::optional<Value> {
  CheckOpen("Transaction::Read");
  EntityState& state = Touch(address.Key());
  if (read_set_.insert(address).second) {
    reads_.push_back(address);
  }
  return GetAtPath(state.working, address.path);
}

void Transaction::Write(const Address& address, Value value) {
  CheckOpen("Transaction::Write");
  EntityState& state = Touch(address.Key());
  SetAtPath(state.working, address.path, std::move(value));
  state.written = true;
  if (write_set_.insert(address).second) {
    writes_.push_back(address);
  }
}

auto Transaction::Log() const -> ReactivityLog {
  return ReactivityLog{
      .reads = reads_,
      .writes = writes_,
      .potential_writes = {},
  };
}

auto Transaction::Commit(CommitCallback on_settled) -> Result<void> {
  CheckOpen("Transaction::Commit");
  finished_ = true;

  std::vector<Fact> facts;
  for (auto& [key, state] : entities_) {
    if (!state.written) {
      continue;
    }
    std::optional<Value> base =
        state.snapshot ? state.snapshot->is : std::nullopt;
    if (state.working == base) {
      continue;
    }

    auto current = tiers_.Read(key);
    if (!current) {
      return std::unexpected(current.error());
    }
    if (RefOf(*current) != RefOf(state.snapshot)) {
      return std::unexpected(
          Diagnostic::Error(
              ErrorCode::kCommitConflict,
              fmt::format("{} changed since it was read", ToString(key))));
    }
    facts.push_back(
        MakeFact(key, std::move(state.working), RefOf(state.snapshot)));
  }
  entities_.clear();

  if (facts.empty()) {
    if (on_settled) {
      on_settled(CommitReceipt{});
    }
    return {};
  }
  tiers_.Stage(std::move(facts), std::move(on_settled));
  return {};
}

void Transaction::Abort() {
  finished_ = true;
  entities_.clear();
}

auto Transaction::Touch(const EntityKey& key) -> EntityState& {
  auto it = entities_.find(key);
  if (it != entities_.end()) {
    return it->second;
  }
  auto fact = tiers_.Read(key);
  if (!fact) {
    throw DiagnosticException(fact.error());
  }
  EntityState state;
  state.snapshot = *fact;
  if (state.snapshot) {
    state.working = state.snapshot->is;
  }
  return entities_.emplace(key, std::move(state)).first->second;
}

void Transaction::CheckOpen(const char* op) const {
  if (finished_) {
    common::ThrowInternalError(op, "transaction already committed or aborted");
  }
}

}  // namespace ripple::storage

#include "ripple/storage/cache.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace ripple::storage {

namespace fs = std::filesystem;

auto MemoryCache::Load(const EntityKey& key) const -> std::optional<Fact> {
  auto it = facts_.find(key);
  if (it == facts_.end()) {
    return std::nullopt;
  }
  return it->second;
}

auto MemoryCache::Store(const Fact& fact) -> Result<void> {
  auto it = facts_.find(fact.of);
  // Newer confirmation wins; an older write-through must not roll back.
  if (it != facts_.end() && it->second.since > fact.since) {
    return {};
  }
  facts_.insert_or_assign(fact.of, fact);
  return {};
}

auto FileCache::Open(const fs::path& path) -> Result<std::unique_ptr<FileCache>> {
  std::unique_ptr<FileCache> cache(new FileCache(path));
  if (!fs::exists(path)) {
    return cache;
  }

  std::ifstream in(path);
  if (!in) {
    return std::unexpected(
        Diagnostic::Error(
            ErrorCode::kStoreError,
            fmt::format("cannot open cache file {}", path.string())));
  }

  std::string line;
  size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (line.empty()) {
      continue;
    }
    auto json = nlohmann::json::parse(line, nullptr, /*allow_exceptions=*/false);
    if (json.is_discarded()) {
      return std::unexpected(
          Diagnostic::Error(
              ErrorCode::kStoreError,
              fmt::format("{}:{}: invalid JSON record", path.string(), line_no)));
    }
    auto fact = FactFromJson(json);
    if (!fact) {
      return std::unexpected(
          std::move(fact.error())
              .WithNote(fmt::format("in {}:{}", path.string(), line_no)));
    }
    if (auto stored = cache->memory_.Store(*fact); !stored) {
      return std::unexpected(stored.error());
    }
  }
  return cache;
}

auto FileCache::Load(const EntityKey& key) const -> std::optional<Fact> {
  return memory_.Load(key);
}

auto FileCache::Store(const Fact& fact) -> Result<void> {
  std::ofstream out(path_, std::ios::app);
  if (!out) {
    return std::unexpected(
        Diagnostic::Error(
            ErrorCode::kStoreError,
            fmt::format("cannot append to cache file {}", path_.string())));
  }
  out << FactToJson(fact).dump() << '\n';
  return memory_.Store(fact);
}

}  // namespace ripple::storage

#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <utility>

#include "absl/container/flat_hash_map.h"
#include "ripple/common/diagnostic.hpp"
#include "ripple/storage/address.hpp"
#include "ripple/storage/fact.hpp"

namespace ripple::storage {

// Bottom storage tier: confirmed facts kept across sessions. Only written
// through from the heap, never by local writes directly.
class FactCache {
 public:
  virtual ~FactCache() = default;

  [[nodiscard]] virtual auto Load(const EntityKey& key) const
      -> std::optional<Fact> = 0;
  virtual auto Store(const Fact& fact) -> Result<void> = 0;
  [[nodiscard]] virtual auto Size() const -> size_t = 0;
};

class MemoryCache : public FactCache {
 public:
  [[nodiscard]] auto Load(const EntityKey& key) const
      -> std::optional<Fact> override;
  auto Store(const Fact& fact) -> Result<void> override;
  [[nodiscard]] auto Size() const -> size_t override {
    return facts_.size();
  }

 private:
  absl::flat_hash_map<EntityKey, Fact> facts_;
};

// Persistent cache backed by a JSON-lines file. Each Store appends one record;
// on open, later records for an entity replace earlier ones.
class FileCache : public FactCache {
 public:
  static auto Open(const std::filesystem::path& path)
      -> Result<std::unique_ptr<FileCache>>;

  [[nodiscard]] auto Load(const EntityKey& key) const
      -> std::optional<Fact> override;
  auto Store(const Fact& fact) -> Result<void> override;
  [[nodiscard]] auto Size() const -> size_t override {
    return memory_.Size();
  }

 private:
  explicit FileCache(std::filesystem::path path) : path_(std::move(path)) {
  }

  std::filesystem::path path_;
  MemoryCache memory_;
};

}  // namespace ripple::storage

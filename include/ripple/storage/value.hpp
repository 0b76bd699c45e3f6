#pragma once

#include <optional>

#include <nlohmann/json.hpp>

#include "ripple/storage/address.hpp"

namespace ripple::storage {

using Value = nlohmann::json;

// Value at `path` inside `root`, or nullopt when any step is missing. An
// absent root has no value at any path.
auto GetAtPath(const std::optional<Value>& root, const Path& path)
    -> std::optional<Value>;

// Writes `value` at `path`, creating intermediate objects as needed. An empty
// path replaces the whole root. A step into an array must be a numeric index
// no further than one past the end, which appends. Anything else throws a
// kStoreError DiagnosticException and leaves `root` unchanged.
void SetAtPath(std::optional<Value>& root, const Path& path, Value value);

}  // namespace ripple::storage

#include "ripple/storage/value.hpp"

#include <charconv>
#include <cstddef>
#include <optional>
#include <string>
#include <system_error>
#include <utility>

#include <fmt/format.h>

#include "ripple/common/diagnostic.hpp"

namespace ripple::storage {

namespace {

auto ParseIndex(const std::string& step) -> std::optional<size_t> {
  size_t index = 0;
  const char* end = step.data() + step.size();
  auto [ptr, ec] = std::from_chars(step.data(), end, index);
  if (ec != std::errc{} || ptr != end || step.empty()) {
    return std::nullopt;
  }
  return index;
}

// Array steps must be an index into the array or one past its end. Checked
// before any mutation so a rejected write leaves `root` untouched.
void CheckArraySteps(const Value& root, const Path& path) {
  const Value* current = &root;
  for (const auto& step : path) {
    if (current->is_object()) {
      auto it = current->find(step);
      if (it == current->end()) {
        return;
      }
      current = &*it;
    } else if (current->is_array()) {
      auto index = ParseIndex(step);
      if (!index) {
        throw DiagnosticException(
            Diagnostic::Error(
                ErrorCode::kStoreError,
                fmt::format("path step '{}' does not index an array", step)));
      }
      if (*index > current->size()) {
        throw DiagnosticException(
            Diagnostic::Error(
                ErrorCode::kStoreError,
                fmt::format(
                    "array index {} is past the end (size {})", *index,
                    current->size())));
      }
      if (*index == current->size()) {
        return;
      }
      current = &(*current)[*index];
    } else {
      return;
    }
  }
}

}  // namespace

auto GetAtPath(const std::optional<Value>& root, const Path& path)
    -> std::optional<Value> {
  if (!root) {
    return std::nullopt;
  }
  const Value* current = &*root;
  for (const auto& step : path) {
    if (current->is_object()) {
      auto it = current->find(step);
      if (it == current->end()) {
        return std::nullopt;
      }
      current = &*it;
    } else if (current->is_array()) {
      auto index = ParseIndex(step);
      if (!index || *index >= current->size()) {
        return std::nullopt;
      }
      current = &(*current)[*index];
    } else {
      return std::nullopt;
    }
  }
  return *current;
}

void SetAtPath(std::optional<Value>& root, const Path& path, Value value) {
  if (path.empty()) {
    root = std::move(value);
    return;
  }
  if (!root || !(root->is_object() || root->is_array())) {
    root = Value::object();
  }
  CheckArraySteps(*root, path);

  Value* current = &*root;
  for (size_t i = 0; i < path.size(); ++i) {
    const std::string& step = path[i];
    if (current->is_array()) {
      size_t index = *ParseIndex(step);
      if (index == current->size()) {
        current->push_back(nullptr);
      }
      current = &(*current)[index];
    } else {
      if (!current->is_object()) {
        *current = Value::object();
      }
      current = &(*current)[step];
    }
  }
  *current = std::move(value);
}

}  // namespace ripple::storage

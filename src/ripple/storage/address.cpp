#include "ripple/storage/address.hpp"

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace ripple::storage {

auto IsPathPrefix(const Path& prefix, const Path& path) -> bool {
  if (prefix.size() > path.size()) {
    return false;
  }
  return std::equal(prefix.begin(), prefix.end(), path.begin());
}

auto Overlaps(const Address& a, const Address& b) -> bool {
  if (a.space != b.space || a.entity != b.entity) {
    return false;
  }
  return IsPathPrefix(a.path, b.path) || IsPathPrefix(b.path, a.path);
}

auto AnyOverlap(const std::vector<Address>& lhs, const std::vector<Address>& rhs)
    -> bool {
  for (const auto& a : lhs) {
    for (const auto& b : rhs) {
      if (Overlaps(a, b)) {
        return true;
      }
    }
  }
  return false;
}

auto SortAndCompact(std::vector<Address> addresses) -> std::vector<Address> {
  std::ranges::sort(addresses);
  std::vector<Address> result;
  result.reserve(addresses.size());
  // A path sorts directly after its prefix, and everything between the two
  // also extends that prefix, so comparing with the last kept entry suffices.
  for (auto& addr : addresses) {
    if (!result.empty()) {
      const Address& last = result.back();
      if (last.space == addr.space && last.entity == addr.entity &&
          IsPathPrefix(last.path, addr.path)) {
        continue;
      }
    }
    result.push_back(std::move(addr));
  }
  return result;
}

auto ToString(const EntityKey& key) -> std::string {
  return fmt::format("{}/{}", key.space, key.entity);
}

auto ToString(const Address& addr) -> std::string {
  if (addr.path.empty()) {
    return fmt::format("{}/{}", addr.space, addr.entity);
  }
  return fmt::format(
      "{}/{}/{}", addr.space, addr.entity, fmt::join(addr.path, "/"));
}

}  // namespace ripple::storage

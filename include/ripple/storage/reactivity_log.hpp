#pragma once

#include <vector>

#include "ripple/storage/address.hpp"

namespace ripple::storage {

// Addresses an action touched in one run. `potential_writes` are declared by
// the action up front (writes it may perform on some runs but not this one).
struct ReactivityLog {
  std::vector<Address> reads;
  std::vector<Address> writes;
  std::vector<Address> potential_writes;

  auto operator==(const ReactivityLog&) const -> bool = default;
};

}  // namespace ripple::storage

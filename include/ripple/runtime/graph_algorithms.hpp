#pragma once

#include <vector>

#include "absl/container/flat_hash_map.h"
#include "ripple/common/ids.hpp"

namespace ripple::runtime {

// Successor lists restricted to some node set. Missing keys have no edges.
using EdgeMap = absl::flat_hash_map<ActionId, std::vector<ActionId>>;

// Tarjan's algorithm. Components come out in reverse topological order of the
// condensation (sinks first); members of each component are sorted. Visiting
// order follows `nodes` and successor order, so the result is deterministic.
auto StronglyConnectedComponents(
    const std::vector<ActionId>& nodes, const EdgeMap& edges)
    -> std::vector<std::vector<ActionId>>;

// Kahn's algorithm over `nodes`. When every remaining node still has an
// unvisited predecessor, the one with the fewest is taken next (lowest id on
// ties), so cyclic input still yields a total order.
auto TopologicalOrder(const std::vector<ActionId>& nodes, const EdgeMap& edges)
    -> std::vector<ActionId>;

}  // namespace ripple::runtime

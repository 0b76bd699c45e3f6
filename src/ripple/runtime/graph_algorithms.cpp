#include "ripple/runtime/graph_algorithms.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <vector>

#include "absl/container/btree_set.h"
#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"

namespace ripple::runtime {

namespace {

class Tarjan {
 public:
  Tarjan(const absl::flat_hash_set<ActionId>& members, const EdgeMap& edges)
      : members_(members), edges_(edges) {
  }

  void Visit(ActionId v) {
    // Iterative to keep deep chains off the call stack.
    struct Frame {
      ActionId node;
      size_t next_edge;
    };
    std::vector<Frame> frames;
    Enter(v);
    frames.push_back({.node = v, .next_edge = 0});

    while (!frames.empty()) {
      Frame& frame = frames.back();
      const auto* succ = Successors(frame.node);
      if (succ != nullptr && frame.next_edge < succ->size()) {
        ActionId w = (*succ)[frame.next_edge++];
        if (!members_.contains(w)) {
          continue;
        }
        auto it = index_.find(w);
        if (it == index_.end()) {
          Enter(w);
          frames.push_back({.node = w, .next_edge = 0});
        } else if (on_stack_.contains(w)) {
          lowlink_[frame.node] = std::min(lowlink_[frame.node], it->second);
        }
        continue;
      }

      ActionId node = frame.node;
      frames.pop_back();
      if (!frames.empty()) {
        ActionId parent = frames.back().node;
        lowlink_[parent] = std::min(lowlink_[parent], lowlink_[node]);
      }
      if (lowlink_[node] == index_[node]) {
        std::vector<ActionId> component;
        ActionId w;
        do {
          w = stack_.back();
          stack_.pop_back();
          on_stack_.erase(w);
          component.push_back(w);
        } while (w != node);
        std::ranges::sort(component);
        components_.push_back(std::move(component));
      }
    }
  }

  [[nodiscard]] auto Seen(ActionId v) const -> bool {
    return index_.contains(v);
  }

  auto TakeComponents() -> std::vector<std::vector<ActionId>> {
    return std::move(components_);
  }

 private:
  void Enter(ActionId v) {
    index_[v] = next_index_;
    lowlink_[v] = next_index_;
    ++next_index_;
    stack_.push_back(v);
    on_stack_.insert(v);
  }

  auto Successors(ActionId v) const -> const std::vector<ActionId>* {
    auto it = edges_.find(v);
    return it == edges_.end() ? nullptr : &it->second;
  }

  const absl::flat_hash_set<ActionId>& members_;
  const EdgeMap& edges_;
  uint32_t next_index_ = 0;
  absl::flat_hash_map<ActionId, uint32_t> index_;
  absl::flat_hash_map<ActionId, uint32_t> lowlink_;
  std::vector<ActionId> stack_;
  absl::flat_hash_set<ActionId> on_stack_;
  std::vector<std::vector<ActionId>> components_;
};

}  // namespace

auto StronglyConnectedComponents(
    const std::vector<ActionId>& nodes, const EdgeMap& edges)
    -> std::vector<std::vector<ActionId>> {
  absl::flat_hash_set<ActionId> members(nodes.begin(), nodes.end());
  Tarjan tarjan(members, edges);
  for (ActionId v : nodes) {
    if (!tarjan.Seen(v)) {
      tarjan.Visit(v);
    }
  }
  return tarjan.TakeComponents();
}

auto TopologicalOrder(const std::vector<ActionId>& nodes, const EdgeMap& edges)
    -> std::vector<ActionId> {
  absl::flat_hash_set<ActionId> members(nodes.begin(), nodes.end());
  absl::flat_hash_map<ActionId, size_t> in_degree;
  for (ActionId v : members) {
    in_degree[v] = 0;
  }
  for (ActionId v : members) {
    auto it = edges.find(v);
    if (it == edges.end()) {
      continue;
    }
    for (ActionId w : it->second) {
      if (w != v && members.contains(w)) {
        ++in_degree[w];
      }
    }
  }

  absl::btree_set<ActionId> ready;
  absl::btree_set<ActionId> remaining;
  for (const auto& [v, degree] : in_degree) {
    remaining.insert(v);
    if (degree == 0) {
      ready.insert(v);
    }
  }

  std::vector<ActionId> order;
  order.reserve(members.size());
  while (!remaining.empty()) {
    ActionId next;
    if (!ready.empty()) {
      next = *ready.begin();
      ready.erase(ready.begin());
    } else {
      // Cycle: take the node closest to being ready.
      size_t best = std::numeric_limits<size_t>::max();
      for (ActionId v : remaining) {
        if (in_degree[v] < best) {
          best = in_degree[v];
          next = v;
        }
      }
    }
    remaining.erase(next);
    order.push_back(next);

    auto it = edges.find(next);
    if (it == edges.end()) {
      continue;
    }
    for (ActionId w : it->second) {
      if (w == next || !remaining.contains(w)) {
        continue;
      }
      if (--in_degree[w] == 0) {
        ready.insert(w);
      }
    }
  }
  return order;
}

}  // namespace ripple::runtime

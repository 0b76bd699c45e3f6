#include "ripple/runtime/dependency_graph.hpp"

#include <cstddef>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "ripple/common/internal_error.hpp"
#include "ripple/storage/value.hpp"

namespace ripple::runtime {

using storage::Address;

auto DependencyGraph::Subscribe(ActionId id, const storage::ReactivityLog& log)
    -> Result<void> {
  Node next;
  next.log.reads = storage::SortAndCompact(log.reads);
  next.log.writes = storage::SortAndCompact(log.writes);
  next.log.potential_writes = storage::SortAndCompact(log.potential_writes);

  std::vector<Address> might_write = next.log.writes;
  might_write.insert(
      might_write.end(), next.log.potential_writes.begin(),
      next.log.potential_writes.end());
  if (auto it = nodes_.find(id); it != nodes_.end()) {
    might_write.insert(
        might_write.end(), it->second.might_write.begin(),
        it->second.might_write.end());
  }
  next.might_write = storage::SortAndCompact(std::move(might_write));

  size_t count = next.log.reads.size() + next.might_write.size();
  if (count > limits_.max_per_action) {
    return std::unexpected(
        Diagnostic::Error(
            ErrorCode::kSubscriptionLimit,
            fmt::format(
                "action subscribes to {} addresses (limit {})", count,
                limits_.max_per_action))
            .ForAction(id));
  }
  size_t previous = 0;
  if (auto it = nodes_.find(id); it != nodes_.end()) {
    previous = it->second.log.reads.size() + it->second.might_write.size();
  }
  if (total_subscriptions_ - previous + count > limits_.max_total) {
    return std::unexpected(
        Diagnostic::Error(
            ErrorCode::kSubscriptionLimit,
            fmt::format(
                "total subscriptions would exceed {}", limits_.max_total))
            .ForAction(id));
  }

  if (auto it = nodes_.find(id); it != nodes_.end()) {
    Unlink(id, it->second);
    nodes_.erase(it);
  }
  total_subscriptions_ = total_subscriptions_ - previous + count;

  for (const auto& addr : next.log.reads) {
    next.read_entities.insert(Intern(addr.Key()));
  }
  for (const auto& addr : next.might_write) {
    next.write_entities.insert(Intern(addr.Key()));
  }
  Node& node = nodes_.emplace(id, std::move(next)).first->second;
  Link(id, node);
  return {};
}

void DependencyGraph::Unsubscribe(ActionId id) {
  auto it = nodes_.find(id);
  if (it == nodes_.end()) {
    return;
  }
  total_subscriptions_ -=
      it->second.log.reads.size() + it->second.might_write.size();
  Unlink(id, it->second);
  nodes_.erase(it);
}

auto DependencyGraph::GetLog(ActionId id) const
    -> const storage::ReactivityLog& {
  return GetNode(id).log;
}

auto DependencyGraph::MightWrite(ActionId id) const
    -> const std::vector<Address>& {
  return GetNode(id).might_write;
}

auto DependencyGraph::Dependents(ActionId id) const -> std::vector<ActionId> {
  const Node& node = GetNode(id);
  return {node.dependents.begin(), node.dependents.end()};
}

auto DependencyGraph::Dependencies(ActionId id) const -> std::vector<ActionId> {
  const Node& node = GetNode(id);
  return {node.dependencies.begin(), node.dependencies.end()};
}

auto DependencyGraph::Triggered(const storage::StorageChange& change) const
    -> std::vector<ActionId> {
  std::vector<ActionId> result;
  const EntityId* entity = Lookup(change.entity);
  if (entity == nullptr) {
    return result;
  }
  auto readers = readers_.find(*entity);
  if (readers == readers_.end()) {
    return result;
  }
  for (ActionId reader : readers->second) {
    const Node& node = GetNode(reader);
    for (const Address& addr : node.log.reads) {
      if (addr.Key() != change.entity) {
        continue;
      }
      if (storage::GetAtPath(change.before, addr.path) !=
          storage::GetAtPath(change.after, addr.path)) {
        result.push_back(reader);
        break;
      }
    }
  }
  return result;
}

auto DependencyGraph::EdgesWithin(const std::vector<ActionId>& nodes) const
    -> EdgeMap {
  absl::btree_set<ActionId> members(nodes.begin(), nodes.end());
  EdgeMap edges;
  for (ActionId id : members) {
    auto it = nodes_.find(id);
    if (it == nodes_.end()) {
      continue;
    }
    auto& out = edges[id];
    for (ActionId dependent : it->second.dependents) {
      if (members.contains(dependent)) {
        out.push_back(dependent);
      }
    }
  }
  return edges;
}

auto DependencyGraph::Intern(const storage::EntityKey& key) -> EntityId {
  auto [it, inserted] = entity_ids_.try_emplace(
      key, EntityId{.value = static_cast<uint32_t>(entity_ids_.size())});
  return it->second;
}

auto DependencyGraph::Lookup(const storage::EntityKey& key) const
    -> const EntityId* {
  auto it = entity_ids_.find(key);
  return it == entity_ids_.end() ? nullptr : &it->second;
}

auto DependencyGraph::GetNode(ActionId id) const -> const Node& {
  auto it = nodes_.find(id);
  if (it == nodes_.end()) {
    common::ThrowInternalError(
        "DependencyGraph", fmt::format("unknown action {}", id.value));
  }
  return it->second;
}

auto DependencyGraph::Feeds(const Node& writer, const Node& reader) -> bool {
  return storage::AnyOverlap(writer.might_write, reader.log.reads);
}

void DependencyGraph::Link(ActionId id, Node& node) {
  for (EntityId entity : node.read_entities) {
    readers_[entity].insert(id);
  }
  for (EntityId entity : node.write_entities) {
    writers_[entity].insert(id);
  }

  // Readers of what this action might write.
  for (EntityId entity : node.write_entities) {
    auto readers = readers_.find(entity);
    if (readers == readers_.end()) {
      continue;
    }
    for (ActionId reader : readers->second) {
      if (reader == id) {
        continue;
      }
      Node& other = nodes_.at(reader);
      if (Feeds(node, other)) {
        node.dependents.insert(reader);
        other.dependencies.insert(id);
      }
    }
  }
  // Writers of what this action reads.
  for (EntityId entity : node.read_entities) {
    auto writers = writers_.find(entity);
    if (writers == writers_.end()) {
      continue;
    }
    for (ActionId writer : writers->second) {
      if (writer == id) {
        continue;
      }
      Node& other = nodes_.at(writer);
      if (Feeds(other, node)) {
        other.dependents.insert(id);
        node.dependencies.insert(writer);
      }
    }
  }
}

void DependencyGraph::Unlink(ActionId id, Node& node) {
  for (EntityId entity : node.read_entities) {
    if (auto it = readers_.find(entity); it != readers_.end()) {
      it->second.erase(id);
      if (it->second.empty()) {
        readers_.erase(it);
      }
    }
  }
  for (EntityId entity : node.write_entities) {
    if (auto it = writers_.find(entity); it != writers_.end()) {
      it->second.erase(id);
      if (it->second.empty()) {
        writers_.erase(it);
      }
    }
  }
  for (ActionId dependent : node.dependents) {
    if (auto it = nodes_.find(dependent); it != nodes_.end()) {
      it->second.dependencies.erase(id);
    }
  }
  for (ActionId dependency : node.dependencies) {
    if (auto it = nodes_.find(dependency); it != nodes_.end()) {
      it->second.dependents.erase(id);
    }
  }
}

}  // namespace ripple::runtime

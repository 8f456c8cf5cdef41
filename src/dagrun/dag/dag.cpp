#include "dagrun/dag/dag.hpp"

#include <algorithm>
#include <ranges>
#include <utility>
#include <vector>

namespace dagrun {

auto DAG::add_node(TaskId task_id) -> Result<NodeIndex> {
  auto it = key_to_idx_.find(task_id);
  if (it != key_to_idx_.end()) {
    return ok(it->second);
  }

  if (nodes_.size() >= 1'000'000) {
    return fail(Error::InvalidArgument);
  }

  auto idx = static_cast<NodeIndex>(nodes_.size());
  nodes_.emplace_back();
  keys_.emplace_back(task_id);
  key_to_idx_.emplace(std::move(task_id), idx);
  return ok(idx);
}

auto DAG::add_edge(const TaskId &from, const TaskId &to) -> Result<void> {
  NodeIndex from_idx = get_index(from);
  NodeIndex to_idx = get_index(to);
  if (from_idx == kInvalidNode || to_idx == kInvalidNode) [[unlikely]] {
    return fail(Error::NotFound);
  }
  return add_edge(from_idx, to_idx);
}

auto DAG::add_edge(NodeIndex from, NodeIndex to) -> Result<void> {
  if (from >= nodes_.size() || to >= nodes_.size()) [[unlikely]] {
    return fail(Error::InvalidArgument);
  }
  if (from == to) {
    return fail(Error::CycleDetected);
  }
  if (has_edge(from, to)) {
    return ok();
  }

  nodes_[to].deps.emplace_back(from);
  nodes_[from].dependents.emplace_back(to);
  return ok();
}

auto DAG::has_edge(NodeIndex from, NodeIndex to) const noexcept -> bool {
  if (from >= nodes_.size() || to >= nodes_.size()) [[unlikely]]
    return false;

  const auto &dependents = nodes_[from].dependents;
  return std::ranges::find(dependents, to) != dependents.end();
}

auto DAG::has_node(const TaskId &task_id) const -> bool {
  return key_to_idx_.contains(task_id);
}

auto DAG::is_valid(std::vector<TaskId> *cycle) const -> Result<void> {
  // 0 = unvisited, 1 = on the current path, 2 = done
  std::vector<std::uint8_t> state(nodes_.size(), 0);
  std::vector<std::pair<NodeIndex, std::size_t>> stack;
  stack.reserve(nodes_.size());

  for (NodeIndex start :
       std::views::iota(NodeIndex{0}, static_cast<NodeIndex>(nodes_.size()))) {
    if (state[start] != 0)
      continue;

    stack.emplace_back(start, 0);
    state[start] = 1;

    while (!stack.empty()) {
      auto &[node, child_idx] = stack.back();
      const auto &dependents = nodes_[node].dependents;

      if (child_idx < dependents.size()) {
        NodeIndex child = dependents[child_idx++];
        if (state[child] == 1) {
          if (cycle) {
            cycle->clear();
            auto on_path = std::ranges::find_if(
                stack, [child](const auto &frame) {
                  return frame.first == child;
                });
            for (auto it = on_path; it != stack.end(); ++it) {
              cycle->push_back(keys_[it->first]);
            }
            cycle->push_back(keys_[child]);
          }
          return fail(Error::CycleDetected);
        }
        if (state[child] == 0) {
          state[child] = 1;
          stack.emplace_back(child, 0);
        }
      } else {
        state[node] = 2;
        stack.pop_back();
      }
    }
  }
  return ok();
}

auto DAG::get_topological_order() const -> std::vector<TaskId> {
  std::vector<std::size_t> in_degree;
  in_degree.reserve(nodes_.size());
  for (const auto &node : nodes_) {
    in_degree.emplace_back(node.deps.size());
  }

  std::vector<NodeIndex> ready;
  ready.reserve(nodes_.size());
  for (auto [i, deg] : std::views::enumerate(in_degree)) {
    if (deg == 0) {
      ready.emplace_back(static_cast<NodeIndex>(i));
    }
  }

  std::vector<TaskId> result;
  result.reserve(nodes_.size());

  std::size_t head = 0;
  while (head < ready.size()) {
    NodeIndex current = ready[head++];
    result.emplace_back(keys_[current]);

    for (NodeIndex dependent : nodes_[current].dependents) {
      if (--in_degree[dependent] == 0) {
        ready.emplace_back(dependent);
      }
    }
  }

  return result;
}

auto DAG::get_index(const TaskId &task_id) const -> NodeIndex {
  auto it = key_to_idx_.find(task_id);
  return it != key_to_idx_.end() ? it->second : kInvalidNode;
}

} // namespace dagrun

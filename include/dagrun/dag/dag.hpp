#pragma once

#include "dagrun/core/error.hpp"
#include "dagrun/util/id.hpp"

#include <ankerl/unordered_dense.h>

#include <cstdint>
#include <vector>

namespace dagrun {

using NodeIndex = std::uint32_t;
constexpr NodeIndex kInvalidNode = UINT32_MAX;

/// Directed graph of task names; an edge `from -> to` means `to` depends on
/// `from`. Node indices follow insertion order, which keeps the topological
/// order deterministic.
class DAG {
public:
  [[nodiscard]] auto add_node(TaskId task_id) -> Result<NodeIndex>;
  [[nodiscard]] auto add_edge(const TaskId &from, const TaskId &to)
      -> Result<void>;
  [[nodiscard]] auto add_edge(NodeIndex from, NodeIndex to) -> Result<void>;

  [[nodiscard]] auto has_node(const TaskId &task_id) const -> bool;

  /// Fails with CycleDetected; `cycle` (when given) receives the nodes of one
  /// cycle in edge order, first node repeated at the end.
  [[nodiscard]] auto is_valid(std::vector<TaskId> *cycle = nullptr) const
      -> Result<void>;

  /// Kahn's algorithm. Only meaningful when is_valid() succeeds; nodes on a
  /// cycle are left out.
  [[nodiscard]] auto get_topological_order() const -> std::vector<TaskId>;

  [[nodiscard]] auto get_index(const TaskId &task_id) const -> NodeIndex;

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return nodes_.size();
  }
  [[nodiscard]] auto empty() const noexcept -> bool { return nodes_.empty(); }

private:
  [[nodiscard]] auto has_edge(NodeIndex from, NodeIndex to) const noexcept
      -> bool;

  struct Node {
    std::vector<NodeIndex> deps;
    std::vector<NodeIndex> dependents;
  };

  std::vector<Node> nodes_;
  std::vector<TaskId> keys_;
  ankerl::unordered_dense::map<TaskId, NodeIndex> key_to_idx_;
};

} // namespace dagrun

#pragma once

#include "dagrun/core/error.hpp"
#include "dagrun/dag/dag.hpp"
#include "dagrun/task/task_registry.hpp"
#include "dagrun/util/id.hpp"

#include <string>
#include <vector>

namespace dagrun {

/// Computes the transitive closure of a requested task and an execution
/// order for it. Errors: UnknownTask, UnknownDependency, CycleDetected; the
/// diagnostic names the offending task(s).
class DependencyResolver {
public:
  explicit DependencyResolver(const TaskRegistry &registry) noexcept
      : registry_(&registry) {}

  /// Dependency graph restricted to the closure of `requested`.
  [[nodiscard]] auto build_graph(const TaskId &requested,
                                 std::string *diagnostic = nullptr) const
      -> Result<DAG>;

  /// Topological order of the closure; `requested` is always the last
  /// element.
  [[nodiscard]] auto resolve(const TaskId &requested,
                             std::string *diagnostic = nullptr) const
      -> Result<std::vector<TaskId>>;

private:
  const TaskRegistry *registry_;
};

} // namespace dagrun

#include "dagrun/dag/resolver.hpp"

#include "dagrun/util/log.hpp"

#include <ankerl/unordered_dense.h>

#include <format>
#include <utility>

namespace dagrun {

namespace {

[[nodiscard]] auto render_cycle(const std::vector<TaskId> &cycle)
    -> std::string {
  std::string out;
  for (const auto &id : cycle) {
    if (!out.empty())
      out += " -> ";
    out += id.str();
  }
  return out;
}

} // namespace

auto DependencyResolver::build_graph(const TaskId &requested,
                                     std::string *diagnostic) const
    -> Result<DAG> {
  if (!registry_->contains(requested)) {
    set_diagnostic(diagnostic, std::format("unknown task '{}'", requested));
    return fail(Error::UnknownTask);
  }

  // Depth-first exploration; each reachable task is expanded exactly once and
  // its dependencies are checked against the registry when it is visited.
  std::vector<std::pair<TaskId, std::vector<TaskId>>> explored;
  ankerl::unordered_dense::set<TaskId> visited;
  std::vector<TaskId> pending{requested};
  visited.insert(requested);

  while (!pending.empty()) {
    TaskId current = std::move(pending.back());
    pending.pop_back();

    const Task *task = registry_->find(current);
    auto deps = task->dependencies();
    for (const auto &dep : deps) {
      if (!registry_->contains(dep)) {
        set_diagnostic(diagnostic,
                       std::format("task '{}' depends on unknown task '{}'",
                                   current, dep));
        return fail(Error::UnknownDependency);
      }
      if (visited.insert(dep).second) {
        pending.push_back(dep);
      }
    }
    explored.emplace_back(std::move(current), std::move(deps));
  }

  DAG dag;
  for (const auto &[task_id, deps] : explored) {
    if (auto r = dag.add_node(task_id); !r) {
      return fail(r.error());
    }
  }
  for (const auto &[task_id, deps] : explored) {
    for (const auto &dep : deps) {
      if (auto r = dag.add_edge(dep, task_id); !r) {
        return fail(r.error());
      }
    }
  }

  std::vector<TaskId> cycle;
  if (auto r = dag.is_valid(&cycle); !r) {
    set_diagnostic(diagnostic, std::format("dependency cycle detected: {}",
                                           render_cycle(cycle)));
    return fail(r.error());
  }
  return ok(std::move(dag));
}

auto DependencyResolver::resolve(const TaskId &requested,
                                 std::string *diagnostic) const
    -> Result<std::vector<TaskId>> {
  auto dag = build_graph(requested, diagnostic);
  if (!dag) {
    return fail(dag.error());
  }

  auto order = dag->get_topological_order();
  log::debug("resolved '{}' into {} task(s)", requested, order.size());
  return ok(std::move(order));
}

} // namespace dagrun

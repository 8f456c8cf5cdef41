#include "dagrun/task/task_registry.hpp"

#include "dagrun/util/log.hpp"

#include <algorithm>
#include <cstdlib>
#include <format>
#include <utility>

namespace dagrun {

auto TaskRegistry::add(Task task, std::string *diagnostic) -> Result<void> {
  if (!is_valid_task_name(task.task_id.value())) {
    set_diagnostic(diagnostic,
                   std::format("invalid task name '{}'", task.task_id));
    return fail(Error::InvalidArgument);
  }
  if (!task.body) {
    set_diagnostic(diagnostic,
                   std::format("task '{}' has no body", task.task_id));
    return fail(Error::InvalidArgument);
  }
  if (index_.contains(task.task_id)) {
    set_diagnostic(diagnostic,
                   std::format("duplicate task '{}'", task.task_id));
    return fail(Error::AlreadyExists);
  }

  for (const auto &dep : task.dependencies()) {
    if (!is_valid_task_name(dep.value())) {
      set_diagnostic(diagnostic,
                     std::format("task '{}': invalid dependency name '{}'",
                                 task.task_id, dep));
      return fail(Error::InvalidArgument);
    }
    if (dep == task.task_id) {
      set_diagnostic(diagnostic, std::format("task '{}' depends on itself",
                                             task.task_id));
      return fail(Error::CycleDetected);
    }
  }

  std::ranges::sort(task.file_dependencies);
  auto [first, last] = std::ranges::unique(task.file_dependencies);
  task.file_dependencies.erase(first, last);

  log::debug("registered task '{}' ({})", task.task_id,
             to_string_view(task.body->kind()));
  index_.emplace(task.task_id, tasks_.size());
  tasks_.push_back(std::move(task));
  return ok();
}

auto TaskRegistry::require_env(std::string name) -> Result<void> {
  if (name.empty() || has_control_chars(name) ||
      name.find('=') != std::string::npos) {
    return fail(Error::InvalidArgument);
  }
  if (std::ranges::find(required_env_, name) == required_env_.end()) {
    required_env_.push_back(std::move(name));
  }
  return ok();
}

auto TaskRegistry::find(const TaskId &task_id) const noexcept -> const Task * {
  auto it = index_.find(task_id);
  if (it == index_.end()) {
    return nullptr;
  }
  return &tasks_[it->second];
}

auto TaskRegistry::first_missing_env() const -> std::optional<std::string> {
  for (const auto &name : required_env_) {
    if (std::getenv(name.c_str()) == nullptr) {
      return name;
    }
  }
  return std::nullopt;
}

} // namespace dagrun

#pragma once

#include "dagrun/core/error.hpp"
#include "dagrun/task/task.hpp"
#include "dagrun/util/id.hpp"

#include <ankerl/unordered_dense.h>

#include <optional>
#include <span>
#include <string>
#include <vector>

namespace dagrun {

/// Declared tasks for one run, plus environment variables the run requires.
/// Built explicitly by the caller (definition loader, tests) and handed by
/// reference to the resolver and the run controller.
class TaskRegistry {
public:
  /// Register a task. Fails with AlreadyExists for a duplicate name and with
  /// InvalidArgument for an unusable name, a missing body, or a dependency
  /// name that is not a valid task name.
  [[nodiscard]] auto add(Task task, std::string *diagnostic = nullptr)
      -> Result<void>;

  /// Mark an environment variable as required before any run proceeds.
  [[nodiscard]] auto require_env(std::string name) -> Result<void>;

  [[nodiscard]] auto find(const TaskId &task_id) const noexcept
      -> const Task *;
  [[nodiscard]] auto contains(const TaskId &task_id) const noexcept -> bool {
    return index_.contains(task_id);
  }

  /// Tasks in declaration order.
  [[nodiscard]] auto tasks() const noexcept -> std::span<const Task> {
    return tasks_;
  }
  [[nodiscard]] auto required_env() const noexcept
      -> std::span<const std::string> {
    return required_env_;
  }

  /// First required variable that is unset in the current environment.
  [[nodiscard]] auto first_missing_env() const -> std::optional<std::string>;

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return tasks_.size();
  }
  [[nodiscard]] auto empty() const noexcept -> bool { return tasks_.empty(); }

private:
  std::vector<Task> tasks_;
  ankerl::unordered_dense::map<TaskId, std::size_t> index_;
  std::vector<std::string> required_env_;
};

} // namespace dagrun

#pragma once

#include "dagrun/core/error.hpp"
#include "dagrun/util/enum.hpp"
#include "dagrun/util/id.hpp"

#include <boost/describe/enum.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dagrun {

enum class BodyKind : std::uint8_t {
  Shell,
  Script,
  Exec,
};
BOOST_DESCRIBE_ENUM(BodyKind, Shell, Script, Exec)
DAGRUN_DEFINE_ENUM_SERDE(BodyKind, BodyKind::Shell)

/// How a dependency's output reaches the dependent task.
enum class DependencyMode : std::uint8_t {
  File,
  Stdin,
};
BOOST_DESCRIBE_ENUM(DependencyMode, File, Stdin)
DAGRUN_DEFINE_ENUM_SERDE(DependencyMode, DependencyMode::File)

/// What a body gets to see when it is asked for its command line.
struct TaskContext {
  TaskId task_id;
  std::filesystem::path workspace;
};

/// Opaque executable unit. The engine runs whatever argv the body produces as
/// the task's process; exit status 0 means success.
class ITaskBody {
public:
  virtual ~ITaskBody() = default;

  [[nodiscard]] virtual auto kind() const noexcept -> BodyKind = 0;

  /// argv[0] is either an absolute/relative path or a name looked up in PATH.
  [[nodiscard]] virtual auto command_line(const TaskContext &ctx) const
      -> Result<std::vector<std::string>> = 0;

  /// Short human-readable rendering for listings and logs.
  [[nodiscard]] virtual auto describe() const -> std::string = 0;
};

using TaskBodyPtr = std::shared_ptr<const ITaskBody>;

/// `/bin/sh -c <command>`
[[nodiscard]] auto make_shell_body(std::string command) -> TaskBodyPtr;

/// Writes `<workspace>/<task>.bash` and runs it with `interpreter`.
[[nodiscard]] auto make_script_body(std::string script,
                                    std::string interpreter = "/bin/bash")
    -> TaskBodyPtr;

/// Runs argv directly, without a shell.
[[nodiscard]] auto make_exec_body(std::vector<std::string> argv)
    -> TaskBodyPtr;

struct Task {
  TaskId task_id;
  std::optional<TaskId> stdin_dependency;
  std::vector<TaskId> file_dependencies;
  TaskBodyPtr body;

  /// Union of the file dependencies and the stdin dependency, sorted and
  /// free of duplicates.
  [[nodiscard]] auto dependencies() const -> std::vector<TaskId>;

  [[nodiscard]] auto is_gated() const noexcept -> bool {
    return !file_dependencies.empty();
  }
};

/// Fluent construction for code-declared tasks (tests, embedders).
struct TaskBuilder {
  Task task_;

  explicit TaskBuilder(std::string name) {
    task_.task_id = TaskId{std::move(name)};
  }

  auto stdin_from(std::string producer) -> TaskBuilder && {
    task_.stdin_dependency = TaskId{std::move(producer)};
    return std::move(*this);
  }

  auto file_dep(std::string dependency) -> TaskBuilder && {
    task_.file_dependencies.emplace_back(std::move(dependency));
    return std::move(*this);
  }

  auto shell(std::string command) -> TaskBuilder && {
    task_.body = make_shell_body(std::move(command));
    return std::move(*this);
  }

  auto script(std::string text, std::string interpreter = "/bin/bash")
      -> TaskBuilder && {
    task_.body = make_script_body(std::move(text), std::move(interpreter));
    return std::move(*this);
  }

  auto exec(std::vector<std::string> argv) -> TaskBuilder && {
    task_.body = make_exec_body(std::move(argv));
    return std::move(*this);
  }

  [[nodiscard]] auto build() && -> Task { return std::move(task_); }
};

} // namespace dagrun

#include "dagrun/config/task_file_loader.hpp"
#include "dagrun/config/toml_util.hpp"

#include "dagrun/task/task.hpp"
#include "dagrun/util/log.hpp"

#include <glaze/toml.hpp>

#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace dagrun {
namespace detail {

struct TaskDependencyToml {
  std::string task;
  std::string mode{"file"};
};

struct TaskToml {
  std::string id;
  std::string command;
  std::string script;
  std::string interpreter;
  std::vector<std::string> exec;
  std::string stdin_from;
  std::vector<std::string> files;
  std::vector<std::variant<std::string, TaskDependencyToml>> dependencies;
};

struct TaskFileToml {
  std::vector<std::string> required_env;
  std::vector<TaskToml> tasks;
};

} // namespace detail
} // namespace dagrun

namespace glz {
template <> struct meta<dagrun::detail::TaskDependencyToml> {
  using T = dagrun::detail::TaskDependencyToml;
  static constexpr auto value = object("task", &T::task, "mode", &T::mode);
};

template <> struct meta<dagrun::detail::TaskToml> {
  using T = dagrun::detail::TaskToml;
  static constexpr auto value =
      object("id", &T::id, "command", &T::command, "script", &T::script,
             "interpreter", &T::interpreter, "exec", &T::exec, "stdin",
             &T::stdin_from, "files", &T::files, "dependencies",
             &T::dependencies);
};

template <> struct meta<dagrun::detail::TaskFileToml> {
  using T = dagrun::detail::TaskFileToml;
  static constexpr auto value =
      object("required_env", &T::required_env, "tasks", &T::tasks);
};
} // namespace glz

namespace dagrun {
namespace {

[[nodiscard]] auto join(const std::vector<std::string> &errors)
    -> std::string {
  std::string joined;
  for (std::size_t i = 0; i < errors.size(); ++i) {
    if (i > 0) {
      joined += "; ";
    }
    joined += errors[i];
  }
  return joined;
}

/// Canonical Task for one `[[tasks]]` entry, or nullopt with `errors`
/// extended.
[[nodiscard]] auto convert_task(detail::TaskToml &raw,
                                std::vector<std::string> &errors)
    -> std::optional<Task> {
  const std::size_t before = errors.size();
  const auto name = raw.id.empty() ? std::string("<unnamed>") : raw.id;
  if (raw.id.empty()) {
    errors.emplace_back("task id cannot be empty");
  }

  const int bodies = static_cast<int>(!raw.command.empty()) +
                     static_cast<int>(!raw.script.empty()) +
                     static_cast<int>(!raw.exec.empty());
  if (bodies != 1) {
    errors.emplace_back(std::format(
        "task '{}' must define exactly one of command, script, exec", name));
  }
  if (!raw.interpreter.empty() && raw.script.empty()) {
    errors.emplace_back(std::format(
        "task '{}': interpreter is only valid with a script body", name));
  }

  TaskBuilder builder(raw.id);
  std::optional<std::string> stdin_dep;
  auto set_stdin = [&](std::string producer) {
    if (stdin_dep && *stdin_dep != producer) {
      errors.emplace_back(std::format(
          "task '{}' has more than one stdin dependency ('{}' and '{}')", name,
          *stdin_dep, producer));
      return;
    }
    stdin_dep = std::move(producer);
  };

  if (!raw.stdin_from.empty()) {
    set_stdin(raw.stdin_from);
  }
  for (auto &file : raw.files) {
    std::move(builder).file_dep(std::move(file));
  }
  for (auto &dep : raw.dependencies) {
    if (auto *plain = std::get_if<std::string>(&dep)) {
      std::move(builder).file_dep(std::move(*plain));
      continue;
    }
    auto &table = std::get<detail::TaskDependencyToml>(dep);
    if (table.task.empty()) {
      errors.emplace_back(
          std::format("task '{}' has a dependency without a task name", name));
      continue;
    }
    DependencyMode mode{};
    if (!util::try_parse_enum(table.mode, mode)) {
      errors.emplace_back(
          std::format("task '{}': unknown dependency mode '{}' for '{}'", name,
                      table.mode, table.task));
      continue;
    }
    if (mode == DependencyMode::Stdin) {
      set_stdin(std::move(table.task));
    } else {
      std::move(builder).file_dep(std::move(table.task));
    }
  }
  if (stdin_dep) {
    std::move(builder).stdin_from(std::move(*stdin_dep));
  }

  if (!raw.command.empty()) {
    std::move(builder).shell(std::move(raw.command));
  } else if (!raw.script.empty()) {
    if (raw.interpreter.empty()) {
      std::move(builder).script(std::move(raw.script));
    } else {
      std::move(builder).script(std::move(raw.script),
                                std::move(raw.interpreter));
    }
  } else if (!raw.exec.empty()) {
    std::move(builder).exec(std::move(raw.exec));
  }

  if (errors.size() != before) {
    return std::nullopt;
  }
  return std::move(builder).build();
}

[[nodiscard]] auto parse_registry(std::string_view toml_str,
                                  std::string *diagnostic)
    -> Result<TaskRegistry> {
  auto raw = toml_util::parse_toml<detail::TaskFileToml>(toml_str, diagnostic);
  if (!raw) {
    return fail(raw.error());
  }

  std::vector<std::string> errors;
  Error first_error = Error::Success;
  auto record = [&](Error e, std::string message) {
    if (first_error == Error::Success) {
      first_error = e;
    }
    errors.push_back(std::move(message));
  };

  TaskRegistry registry;
  for (auto &name : raw->required_env) {
    if (auto r = registry.require_env(name); !r) {
      record(Error::InvalidArgument,
             std::format("invalid required_env entry '{}'", name));
    }
  }

  if (raw->tasks.empty()) {
    record(Error::InvalidArgument, "no tasks defined");
  }
  for (auto &raw_task : raw->tasks) {
    std::vector<std::string> task_errors;
    auto task = convert_task(raw_task, task_errors);
    if (!task) {
      for (auto &message : task_errors) {
        record(Error::InvalidArgument, std::move(message));
      }
      continue;
    }
    std::string add_diag;
    if (auto added = registry.add(std::move(*task), &add_diag); !added) {
      record(static_cast<Error>(added.error().value()), std::move(add_diag));
    }
  }

  if (!errors.empty()) {
    for (const auto &err : errors) {
      log::debug("task definition error: {}", err);
    }
    set_diagnostic(diagnostic, join(errors));
    return fail(first_error);
  }
  return ok(std::move(registry));
}

} // namespace

auto TaskFileLoader::load_from_file(std::string_view path,
                                    std::string *diagnostic)
    -> Result<TaskRegistry> {
  auto text = toml_util::read_file(path);
  if (!text) {
    set_diagnostic(diagnostic,
                   std::format("cannot read task file '{}'", path));
    return fail(text.error());
  }
  return load_from_string(*text, diagnostic);
}

auto TaskFileLoader::load_from_string(std::string_view toml_str,
                                      std::string *diagnostic)
    -> Result<TaskRegistry> {
  try {
    return parse_registry(toml_str, diagnostic);
  } catch (const std::exception &e) {
    log::error("task file parse error: {}", e.what());
    set_diagnostic(diagnostic, e.what());
    return fail(Error::ParseError);
  }
}

} // namespace dagrun

#include "dagrun/task/task.hpp"

#include "dagrun/util/log.hpp"

#include <algorithm>
#include <format>
#include <fstream>
#include <utility>

namespace dagrun {

namespace {

/// Truncate a command string for listings (max 60 chars).
[[nodiscard]] auto preview(std::string_view text) -> std::string {
  std::string flat(text);
  std::ranges::replace(flat, '\n', ' ');
  if (flat.size() <= 60)
    return flat;
  return flat.substr(0, 60) + "...";
}

class ShellBody final : public ITaskBody {
public:
  explicit ShellBody(std::string command) : command_(std::move(command)) {}

  [[nodiscard]] auto kind() const noexcept -> BodyKind override {
    return BodyKind::Shell;
  }

  [[nodiscard]] auto command_line(const TaskContext & /*ctx*/) const
      -> Result<std::vector<std::string>> override {
    if (command_.empty()) {
      return fail(Error::InvalidArgument);
    }
    return ok(std::vector<std::string>{"/bin/sh", "-c", command_});
  }

  [[nodiscard]] auto describe() const -> std::string override {
    return preview(command_);
  }

private:
  std::string command_;
};

class ScriptBody final : public ITaskBody {
public:
  ScriptBody(std::string script, std::string interpreter)
      : script_(std::move(script)), interpreter_(std::move(interpreter)) {}

  [[nodiscard]] auto kind() const noexcept -> BodyKind override {
    return BodyKind::Script;
  }

  [[nodiscard]] auto command_line(const TaskContext &ctx) const
      -> Result<std::vector<std::string>> override {
    if (interpreter_.empty()) {
      return fail(Error::InvalidArgument);
    }
    auto path = ctx.workspace / std::format("{}.bash", ctx.task_id);
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
      log::error("cannot write script for task '{}' at {}", ctx.task_id,
                 path.string());
      return fail(Error::FileOpenFailed);
    }
    out << script_;
    if (!script_.empty() && script_.back() != '\n') {
      out << '\n';
    }
    out.close();
    if (!out) {
      return fail(Error::FileOpenFailed);
    }
    return ok(std::vector<std::string>{interpreter_, path.string()});
  }

  [[nodiscard]] auto describe() const -> std::string override {
    return std::format("{} script: {}", interpreter_, preview(script_));
  }

private:
  std::string script_;
  std::string interpreter_;
};

class ExecBody final : public ITaskBody {
public:
  explicit ExecBody(std::vector<std::string> argv) : argv_(std::move(argv)) {}

  [[nodiscard]] auto kind() const noexcept -> BodyKind override {
    return BodyKind::Exec;
  }

  [[nodiscard]] auto command_line(const TaskContext & /*ctx*/) const
      -> Result<std::vector<std::string>> override {
    if (argv_.empty() || argv_.front().empty()) {
      return fail(Error::InvalidArgument);
    }
    return ok(argv_);
  }

  [[nodiscard]] auto describe() const -> std::string override {
    std::string joined;
    for (const auto &arg : argv_) {
      if (!joined.empty())
        joined += ' ';
      joined += arg;
    }
    return preview(joined);
  }

private:
  std::vector<std::string> argv_;
};

} // namespace

auto make_shell_body(std::string command) -> TaskBodyPtr {
  return std::make_shared<ShellBody>(std::move(command));
}

auto make_script_body(std::string script, std::string interpreter)
    -> TaskBodyPtr {
  return std::make_shared<ScriptBody>(std::move(script),
                                      std::move(interpreter));
}

auto make_exec_body(std::vector<std::string> argv) -> TaskBodyPtr {
  return std::make_shared<ExecBody>(std::move(argv));
}

auto Task::dependencies() const -> std::vector<TaskId> {
  std::vector<TaskId> deps = file_dependencies;
  if (stdin_dependency) {
    deps.push_back(*stdin_dependency);
  }
  std::ranges::sort(deps);
  auto [first, last] = std::ranges::unique(deps);
  deps.erase(first, last);
  return deps;
}

} // namespace dagrun

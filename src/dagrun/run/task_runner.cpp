#include "dagrun/run/task_runner.hpp"

#include "dagrun/core/coroutine.hpp"
#include "dagrun/run/process_utils.hpp"
#include "dagrun/util/log.hpp"

#include <boost/asio/readable_pipe.hpp>
#include <boost/process/v2/environment.hpp>
#include <boost/process/v2/process.hpp>
#include <boost/process/v2/stdio.hpp>

#include <cstdio>
#include <format>
#include <iterator>
#include <map>
#include <optional>
#include <utility>
#include <vector>

namespace dagrun {

namespace {

/// The shell stops itself; SIGCONT from the gate lets it exec the body.
inline constexpr std::string_view kGatePrologue = R"(kill -STOP $$ && exec "$@")";
inline constexpr std::string_view kGateArgv0 = "dagrun-gate";

using FilePtr = std::unique_ptr<std::FILE, decltype(&std::fclose)>;

[[nodiscard]] auto resolve_executable(const std::string &name,
                                      std::string *diagnostic)
    -> Result<bp::filesystem::path> {
  if (name.find('/') != std::string::npos) {
    return ok(bp::filesystem::path(name));
  }
  auto found = bp::environment::find_executable(name);
  if (found.empty()) {
    set_diagnostic(diagnostic,
                   std::format("executable '{}' not found in PATH", name));
    return fail(Error::ProcessSpawnFailed);
  }
  return ok(std::move(found));
}

auto gate(std::shared_ptr<RunHandle> handle,
          std::vector<std::shared_ptr<RunHandle>> dependencies,
          boost::asio::thread_pool *pool, RunState *state) -> task<void> {
  for (const auto &dep : dependencies) {
    co_await dep->async_completed();
  }
  if (state->cancelled() || handle->completed()) {
    log::debug("gate of '{}' not released: run cancelled", handle->task_id());
    co_return;
  }

  // The prologue may not have reached its stop yet; a SIGCONT sent before
  // then would be lost and the task would stay suspended.
  const auto pid = handle->pid();
  const bool suspended = co_await co_spawn(
      pool->get_executor(),
      [pid]() -> task<bool> { co_return wait_until_suspended(pid); },
      use_awaitable);

  if (state->cancelled() || handle->completed()) {
    co_return;
  }
  if (!suspended) {
    log::warn("task '{}' exited before its dependencies completed",
              handle->task_id());
    co_return;
  }
  log::debug("releasing task '{}'", handle->task_id());
  handle->resume();
}

} // namespace

auto TaskRunner::start(const Task &task, std::string *diagnostic)
    -> Result<std::shared_ptr<RunHandle>> {
  const auto &task_id = task.task_id;
  if (!task.body) {
    set_diagnostic(diagnostic, std::format("task '{}' has no body", task_id));
    return fail(Error::InvalidArgument);
  }

  auto slot = ctx_.workspace->init_output_slot(task_id);
  if (!slot) {
    set_diagnostic(diagnostic,
                   std::format("cannot create output slot for '{}': {}",
                               task_id, slot.error().message()));
    return fail(slot.error());
  }

  auto argv = task.body->command_line(
      TaskContext{.task_id = task_id, .workspace = ctx_.workspace->path()});
  if (!argv || argv->empty()) {
    set_diagnostic(diagnostic,
                   std::format("cannot prepare command for task '{}'", task_id));
    return fail(Error::ProcessSpawnFailed);
  }

  auto exe = resolve_executable(argv->front(), diagnostic);
  if (!exe) {
    return fail(exe.error());
  }

  std::map<std::string, std::string> env_overrides;
  std::vector<std::shared_ptr<RunHandle>> gate_dependencies;
  for (const auto &dep : task.file_dependencies) {
    auto dep_handle = ctx_.handles->find(dep);
    if (!dep_handle) {
      set_diagnostic(diagnostic,
                     std::format("dependency '{}' of '{}' was not started",
                                 dep, task_id));
      return fail(Error::InvalidArgument);
    }
    if (!is_valid_env_key(dep.value())) {
      log::warn("dependency name '{}' of task '{}' is not a shell identifier; "
                "read it from the environment directly",
                dep, task_id);
    }
    env_overrides.emplace(dep.str(),
                          ctx_.workspace->output_slot(dep).string());
    gate_dependencies.push_back(std::move(dep_handle));
  }

  std::optional<StreamFollower::Attachment> attachment;
  if (task.stdin_dependency) {
    auto attached = StreamFollower::attach(
        ctx_.executor, *task.stdin_dependency, task_id,
        ctx_.workspace->output_slot(*task.stdin_dependency),
        ctx_.follow_poll_interval, diagnostic);
    if (!attached) {
      return fail(Error::ProcessSpawnFailed);
    }
    attachment.emplace(std::move(*attached));
  }

  FilePtr out_file(std::fopen(slot->c_str(), "ae"), &std::fclose);
  if (!out_file) {
    set_diagnostic(diagnostic,
                   std::format("cannot open output slot of '{}'", task_id));
    if (attachment) {
      attachment->follower->detach();
    }
    return fail(Error::FileOpenFailed);
  }

  const bool gated = task.is_gated();
  bp::filesystem::path program;
  std::vector<std::string> args;
  if (gated) {
    program = "/bin/sh";
    args.emplace_back("-c");
    args.emplace_back(kGatePrologue);
    args.emplace_back(kGateArgv0);
    args.push_back(exe->string());
  } else {
    program = std::move(*exe);
  }
  args.insert(args.end(), std::next(argv->begin()), argv->end());

  std::optional<bp::process> proc;
  try {
    auto env = build_process_env(env_overrides);
    if (attachment) {
      proc.emplace(ctx_.executor, program, args,
                   bp::process_stdio{.in = attachment->consumer_end,
                                     .out = out_file.get()},
                   std::move(env), own_process_group{});
    } else {
      proc.emplace(ctx_.executor, program, args,
                   bp::process_stdio{.in = nullptr, .out = out_file.get()},
                   std::move(env), own_process_group{});
    }
  } catch (const std::exception &ex) {
    set_diagnostic(diagnostic, std::format("failed to start task '{}': {}",
                                           task_id, ex.what()));
    if (attachment) {
      attachment->follower->detach();
    }
    return fail(Error::ProcessSpawnFailed);
  }

  auto handle =
      std::make_shared<RunHandle>(task_id, std::move(*proc), gated);
  log::info("started task '{}' pid={} gated={} cmd='{}'", task_id,
            handle->pid(), gated, cmd_preview(task.body->describe()));

  if (attachment) {
    boost::system::error_code ignored;
    attachment->consumer_end.close(ignored);
    ctx_.followers->add(std::move(attachment->follower));
  }
  ctx_.handles->add(handle);

  if (gated) {
    co_spawn(ctx_.executor,
             gate(handle, std::move(gate_dependencies), ctx_.blocking_pool,
                  ctx_.state),
             detached);
  }
  return ok(std::move(handle));
}

} // namespace dagrun

#include "dagrun/run/run_controller.hpp"

#include "dagrun/core/coroutine.hpp"
#include "dagrun/dag/resolver.hpp"
#include "dagrun/run/run_handle.hpp"
#include "dagrun/run/run_state.hpp"
#include "dagrun/run/stream_follower.hpp"
#include "dagrun/run/task_runner.hpp"
#include "dagrun/run/workspace.hpp"
#include "dagrun/util/log.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/use_future.hpp>

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <format>
#include <fstream>
#include <optional>
#include <utility>

namespace dagrun {

auto OutputDestination::parse(std::string_view text) -> OutputDestination {
  if (text.empty() || text == "none") {
    return {};
  }
  if (text == "-") {
    return to_stdout();
  }
  return to_file(std::filesystem::path(text));
}

RunController::RunController(const TaskRegistry &registry, EngineConfig config,
                             RunObserver observer)
    : registry_(&registry), config_(std::move(config)),
      observer_(std::move(observer)) {}

auto RunController::run(const TaskId &requested,
                        const OutputDestination &destination,
                        std::string *diagnostic) -> Result<RunReport> {
  report_ = RunReport{.requested = requested};

  if (auto missing = registry_->first_missing_env(); missing) {
    set_diagnostic(diagnostic,
                   std::format("required environment variable '{}' is not set",
                               *missing));
    return fail(Error::MissingEnvironment);
  }

  DependencyResolver resolver(*registry_);
  auto order = resolver.resolve(requested, diagnostic);
  if (!order) {
    return fail(order.error());
  }
  report_.order = *order;
  log::info("run '{}': {} task(s) to execute", requested, order->size());

  // Writes to a consumer that already exited must surface as EPIPE.
  std::signal(SIGPIPE, SIG_IGN);

  boost::asio::io_context io{1};
  RunState state;
  RunHandleTable handles(io.get_executor(), order->size());
  FollowerRegistry followers;
  CompletionMonitor monitor(handles, followers, state,
                            [this](const TaskOutcome &outcome) {
                              if (observer_.on_task_complete) {
                                observer_.on_task_complete(outcome);
                              }
                            });

  // Armed before any side effect so an interrupt during startup is seen.
  boost::asio::signal_set signals(io, SIGINT, SIGTERM);
  signals.async_wait([&](const boost::system::error_code &ec, int signo) {
    if (ec) {
      return;
    }
    state.interrupted = true;
    monitor.cancel_all(std::format("received signal {}", signo));
  });

  auto workspace =
      Workspace::create(config_.workspace_root, config_.workspace_prefix);
  if (!workspace) {
    set_diagnostic(diagnostic, "cannot create scratch workspace");
    return fail(workspace.error());
  }
  if (observer_.on_workspace) {
    observer_.on_workspace(workspace->path());
  }

  boost::asio::thread_pool pool(
      static_cast<std::size_t>(std::max(1, config_.gate_threads)));
  TaskRunner runner(RunContext{.executor = io.get_executor(),
                               .blocking_pool = &pool,
                               .workspace = &*workspace,
                               .handles = &handles,
                               .followers = &followers,
                               .state = &state,
                               .follow_poll_interval =
                                   config_.follow_poll_interval()});

  std::optional<std::error_code> start_error;
  for (const auto &task_id : *order) {
    io.poll();
    if (state.cancelled()) {
      log::warn("run '{}' cancelled before task '{}' started", requested,
                task_id);
      break;
    }
    const auto *task = registry_->find(task_id);
    auto handle = runner.start(*task, diagnostic);
    if (!handle) {
      log::error("cannot start task '{}': {}", task_id,
                 diagnostic ? *diagnostic : handle.error().message());
      start_error = handle.error();
      state.failed = true;
      monitor.cancel_all(std::format("task '{}' could not start", task_id));
      break;
    }
  }

  // A signal handled during startup may have left the context out of work.
  io.restart();
  auto finished = co_spawn(
      io,
      [&]() -> task<bool> {
        const bool success = co_await monitor.wait();
        boost::system::error_code ignored;
        signals.cancel(ignored);
        co_return success;
      },
      boost::asio::use_future);

  io.run();
  pool.join();

  const bool success = finished.get();
  report_.outcomes = monitor.outcomes();
  report_.interrupted = state.interrupted;
  report_.success = success && !start_error;

  if (start_error) {
    return fail(*start_error);
  }
  if (!success) {
    if (state.interrupted) {
      set_diagnostic(diagnostic, "run interrupted");
    } else {
      std::string failed;
      for (const auto &outcome : report_.outcomes) {
        if (!outcome.success) {
          failed += failed.empty() ? "" : ", ";
          failed += outcome.task_id.str();
        }
      }
      set_diagnostic(diagnostic,
                     std::format("run of '{}' failed (failed: {})", requested,
                                 failed));
    }
    return fail(Error::RunFailed);
  }

  if (auto delivered =
          deliver(workspace->output_slot(order->back()), destination,
                  diagnostic);
      !delivered) {
    return fail(delivered.error());
  }
  return ok(report_);
}

auto RunController::deliver(const std::filesystem::path &slot,
                            const OutputDestination &destination,
                            std::string *diagnostic) -> Result<void> {
  switch (destination.kind) {
  case DestinationKind::None:
    return ok();
  case DestinationKind::Stdout: {
    std::ifstream in(slot, std::ios::binary);
    if (!in) {
      set_diagnostic(diagnostic, std::format("cannot read {}", slot.string()));
      return fail(Error::FileOpenFailed);
    }
    std::array<char, 64 * 1024> buffer{};
    while (in.read(buffer.data(), buffer.size()) || in.gcount() > 0) {
      const auto n = static_cast<std::size_t>(in.gcount());
      if (std::fwrite(buffer.data(), 1, n, stdout) != n) {
        break;
      }
    }
    if (std::fflush(stdout) != 0 || std::ferror(stdout)) {
      const auto err = errno;
      std::clearerr(stdout);
      set_diagnostic(diagnostic,
                     std::format("cannot write output to stdout: {}",
                                 std::strerror(err)));
      return fail(Error::FileOpenFailed);
    }
    return ok();
  }
  case DestinationKind::File: {
    std::error_code ec;
    std::filesystem::copy_file(
        slot, destination.path,
        std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
      set_diagnostic(diagnostic,
                     std::format("cannot write output to {}: {}",
                                 destination.path.string(), ec.message()));
      return fail(Error::FileOpenFailed);
    }
    return ok();
  }
  }
  std::unreachable();
}

} // namespace dagrun

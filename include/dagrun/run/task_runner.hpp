#pragma once

#include "dagrun/core/error.hpp"
#include "dagrun/run/run_handle.hpp"
#include "dagrun/run/run_state.hpp"
#include "dagrun/run/stream_follower.hpp"
#include "dagrun/run/workspace.hpp"
#include "dagrun/task/task.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/thread_pool.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace dagrun {

struct RunContext {
  boost::asio::any_io_executor executor;
  boost::asio::thread_pool *blocking_pool{};
  const Workspace *workspace{};
  RunHandleTable *handles{};
  FollowerRegistry *followers{};
  RunState *state{};
  std::chrono::milliseconds follow_poll_interval{20};
};

/// Starts one task process: output slot, dependency wiring, spawn, gating,
/// registration in the handle table. Dependencies must already be started.
class TaskRunner {
public:
  explicit TaskRunner(RunContext ctx) noexcept : ctx_(std::move(ctx)) {}

  /// A body that exits non-zero shows up later as a failed handle; only
  /// failure to create the process is reported here (ProcessSpawnFailed).
  [[nodiscard]] auto start(const Task &task, std::string *diagnostic = nullptr)
      -> Result<std::shared_ptr<RunHandle>>;

private:
  RunContext ctx_;
};

} // namespace dagrun

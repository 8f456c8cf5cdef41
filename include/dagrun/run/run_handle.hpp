#pragma once

#include "dagrun/core/coroutine.hpp"
#include "dagrun/util/id.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/experimental/channel.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/process/v2/process.hpp>
#include <boost/system/error_code.hpp>

#include <ankerl/unordered_dense.h>

#include <chrono>
#include <cstddef>
#include <memory>
#include <span>
#include <sys/types.h>
#include <vector>

namespace dagrun {

/// One started task process. Touched only from the io thread.
class RunHandle {
public:
  RunHandle(TaskId task_id, boost::process::v2::process process, bool gated);

  RunHandle(const RunHandle &) = delete;
  RunHandle &operator=(const RunHandle &) = delete;

  [[nodiscard]] auto task_id() const noexcept -> const TaskId & {
    return task_id_;
  }
  [[nodiscard]] auto pid() const noexcept -> pid_t { return pid_; }
  [[nodiscard]] auto gated() const noexcept -> bool { return gated_; }
  [[nodiscard]] auto completed() const noexcept -> bool { return completed_; }
  [[nodiscard]] auto exit_code() const noexcept -> int { return exit_code_; }
  [[nodiscard]] auto succeeded() const noexcept -> bool {
    return completed_ && exit_code_ == 0;
  }
  [[nodiscard]] auto elapsed() const noexcept -> std::chrono::milliseconds;

  /// Reaps the process and returns its exit code (-1 when waiting failed).
  /// Called once, by the table's watcher.
  [[nodiscard]] auto async_wait_exit() -> task<int>;

  /// Resolves once mark_completed() has run; used by gates.
  [[nodiscard]] auto async_completed() -> task<void>;

  auto mark_completed(int exit_code) -> void;

  /// SIGTERM then SIGCONT to the task's process group, so a task suspended
  /// at its gate dies without running its body.
  auto terminate() noexcept -> void;

  /// SIGCONT to the task's process group.
  auto resume() noexcept -> void;

private:
  TaskId task_id_;
  boost::process::v2::process process_;
  pid_t pid_;
  bool gated_;
  bool completed_{false};
  int exit_code_{-1};
  std::chrono::steady_clock::time_point started_at_;
  std::chrono::steady_clock::time_point finished_at_;
  boost::asio::steady_timer done_event_;
};

/// Started handles in start order plus the fan-in channel their watchers
/// report completions on.
class RunHandleTable {
public:
  using CompletionChannel = boost::asio::experimental::channel<void(
      boost::system::error_code, TaskId)>;

  RunHandleTable(boost::asio::any_io_executor executor, std::size_t capacity);

  RunHandleTable(const RunHandleTable &) = delete;
  RunHandleTable &operator=(const RunHandleTable &) = delete;

  /// Register a started handle and spawn its watcher.
  auto add(std::shared_ptr<RunHandle> handle) -> void;

  [[nodiscard]] auto find(const TaskId &task_id) const
      -> std::shared_ptr<RunHandle>;

  [[nodiscard]] auto handles() const noexcept
      -> std::span<const std::shared_ptr<RunHandle>> {
    return handles_;
  }
  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return handles_.size();
  }

  [[nodiscard]] auto channel() noexcept -> CompletionChannel & {
    return channel_;
  }

private:
  [[nodiscard]] static auto watch(std::shared_ptr<RunHandle> handle,
                                  CompletionChannel &channel) -> task<void>;

  boost::asio::any_io_executor executor_;
  CompletionChannel channel_;
  std::vector<std::shared_ptr<RunHandle>> handles_;
  ankerl::unordered_dense::map<TaskId, std::size_t> index_;
};

} // namespace dagrun

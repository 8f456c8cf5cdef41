#include "dagrun/run/run_handle.hpp"

#include "dagrun/core/asio_awaitable.hpp"
#include "dagrun/run/process_utils.hpp"
#include "dagrun/util/log.hpp"

#include <algorithm>
#include <csignal>
#include <utility>

namespace dagrun {

RunHandle::RunHandle(TaskId task_id, boost::process::v2::process process,
                     bool gated)
    : task_id_(std::move(task_id)), process_(std::move(process)),
      pid_(process_.id()), gated_(gated),
      started_at_(std::chrono::steady_clock::now()),
      done_event_(process_.get_executor()) {
  done_event_.expires_at(std::chrono::steady_clock::time_point::max());
}

auto RunHandle::elapsed() const noexcept -> std::chrono::milliseconds {
  const auto end =
      completed_ ? finished_at_ : std::chrono::steady_clock::now();
  return std::chrono::duration_cast<std::chrono::milliseconds>(end -
                                                               started_at_);
}

auto RunHandle::async_wait_exit() -> task<int> {
  auto [ec, code] = co_await process_.async_wait(use_nothrow);
  if (ec) {
    log::error("waiting for task '{}' (pid {}) failed: {}", task_id_, pid_,
               ec.message());
    co_return -1;
  }
  co_return code;
}

auto RunHandle::async_completed() -> task<void> {
  while (!completed_) {
    // The timer never expires on its own; mark_completed() cancels it.
    auto [ec] = co_await done_event_.async_wait(use_nothrow);
    (void)ec;
  }
}

auto RunHandle::mark_completed(int exit_code) -> void {
  if (completed_) {
    return;
  }
  completed_ = true;
  exit_code_ = exit_code;
  finished_at_ = std::chrono::steady_clock::now();
  done_event_.cancel();
}

auto RunHandle::terminate() noexcept -> void {
  if (completed_) {
    return;
  }
  (void)signal_task(pid_, SIGTERM);
  (void)signal_task(pid_, SIGCONT);
}

auto RunHandle::resume() noexcept -> void {
  if (completed_) {
    return;
  }
  (void)signal_task(pid_, SIGCONT);
}

RunHandleTable::RunHandleTable(boost::asio::any_io_executor executor,
                               std::size_t capacity)
    : executor_(executor),
      channel_(executor, std::max<std::size_t>(1, capacity)) {
  handles_.reserve(capacity);
}

auto RunHandleTable::add(std::shared_ptr<RunHandle> handle) -> void {
  index_.emplace(handle->task_id(), handles_.size());
  handles_.push_back(handle);
  co_spawn(executor_, watch(std::move(handle), channel_), detached);
}

auto RunHandleTable::find(const TaskId &task_id) const
    -> std::shared_ptr<RunHandle> {
  auto it = index_.find(task_id);
  if (it == index_.end()) {
    return nullptr;
  }
  return handles_[it->second];
}

auto RunHandleTable::watch(std::shared_ptr<RunHandle> handle,
                           CompletionChannel &channel) -> task<void> {
  const int code = co_await handle->async_wait_exit();
  handle->mark_completed(code);
  log::debug("task '{}' exited with code {}", handle->task_id(), code);
  auto [ec] = co_await channel.async_send(boost::system::error_code{},
                                          handle->task_id(), use_nothrow);
  if (ec) {
    log::error("completion of task '{}' was not delivered: {}",
               handle->task_id(), ec.message());
  }
}

} // namespace dagrun

#include "dagrun/run/completion_monitor.hpp"

#include "dagrun/core/asio_awaitable.hpp"
#include "dagrun/util/log.hpp"

#include <format>

namespace dagrun {

auto CompletionMonitor::wait() -> task<bool> {
  const auto expected = handles_->size();
  outcomes_.reserve(expected);

  for (std::size_t drained = 0; drained < expected; ++drained) {
    auto [ec, task_id] =
        co_await handles_->channel().async_receive(use_nothrow);
    if (ec) {
      log::error("completion channel closed after {} of {} tasks: {}",
                 drained, expected, ec.message());
      state_->failed = true;
      co_return false;
    }

    auto handle = handles_->find(task_id);
    if (!handle) {
      log::error("completion for unknown task '{}'", task_id);
      continue;
    }

    if (auto n = followers_->detach_all(task_id); n > 0) {
      log::debug("producer '{}' completed; detached {} follower(s)", task_id,
                 n);
    }

    TaskOutcome outcome{.task_id = task_id,
                        .exit_code = handle->exit_code(),
                        .success = handle->succeeded(),
                        .elapsed = handle->elapsed()};
    if (outcome.success) {
      log::info("task '{}' succeeded in {}ms", task_id,
                outcome.elapsed.count());
    } else if (state_->cancelled()) {
      log::info("task '{}' ended with code {} after cancellation", task_id,
                outcome.exit_code);
    } else {
      log::warn("task '{}' failed with exit code {}", task_id,
                outcome.exit_code);
    }

    outcomes_.push_back(outcome);
    if (on_outcome_) {
      on_outcome_(outcomes_.back());
    }

    if (!outcome.success && !state_->failed) {
      state_->failed = true;
      cancel_all(std::format("task '{}' failed", task_id));
    }
  }

  co_return !state_->failed && !state_->interrupted;
}

auto CompletionMonitor::cancel_all(std::string_view reason) -> void {
  std::size_t signalled = 0;
  for (const auto &handle : handles_->handles()) {
    if (!handle->completed()) {
      handle->terminate();
      ++signalled;
    }
  }
  if (signalled > 0) {
    log::warn("{}; terminating {} running task(s)", reason, signalled);
  }
}

} // namespace dagrun

#pragma once

#include "dagrun/core/coroutine.hpp"
#include "dagrun/run/run_handle.hpp"
#include "dagrun/run/run_state.hpp"
#include "dagrun/run/stream_follower.hpp"
#include "dagrun/util/id.hpp"

#include <chrono>
#include <functional>
#include <string_view>
#include <vector>

namespace dagrun {

struct TaskOutcome {
  TaskId task_id;
  int exit_code{-1};
  bool success{false};
  std::chrono::milliseconds elapsed{0};
};

/// Receives every handle's completion in completion order. The first failure
/// cancels the rest of the run; waiting continues until all handles drained.
class CompletionMonitor {
public:
  using OutcomeCallback = std::move_only_function<void(const TaskOutcome &)>;

  CompletionMonitor(RunHandleTable &handles, FollowerRegistry &followers,
                    RunState &state, OutcomeCallback on_outcome = {}) noexcept
      : handles_(&handles), followers_(&followers), state_(&state),
        on_outcome_(std::move(on_outcome)) {}

  /// True iff no task failed and the run was not interrupted.
  [[nodiscard]] auto wait() -> task<bool>;

  /// Terminate every handle that is still alive.
  auto cancel_all(std::string_view reason) -> void;

  [[nodiscard]] auto outcomes() const noexcept
      -> const std::vector<TaskOutcome> & {
    return outcomes_;
  }

private:
  RunHandleTable *handles_;
  FollowerRegistry *followers_;
  RunState *state_;
  OutcomeCallback on_outcome_;
  std::vector<TaskOutcome> outcomes_;
};

} // namespace dagrun

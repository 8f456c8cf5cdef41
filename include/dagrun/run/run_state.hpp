#pragma once

namespace dagrun {

/// Run-wide flags shared by the runner, its gates and the monitor.
struct RunState {
  bool failed{false};
  bool interrupted{false};

  [[nodiscard]] auto cancelled() const noexcept -> bool {
    return failed || interrupted;
  }
};

} // namespace dagrun

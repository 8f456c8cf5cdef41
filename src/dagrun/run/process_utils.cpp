#include "dagrun/run/process_utils.hpp"

#include <sys/wait.h>

namespace dagrun {

auto wait_until_suspended(pid_t pid) noexcept -> bool {
  siginfo_t info{};
  for (;;) {
    // WNOWAIT leaves the state change in place for the process owner to reap.
    if (::waitid(P_PID, static_cast<id_t>(pid), &info,
                 WSTOPPED | WEXITED | WNOWAIT) == 0) {
      return info.si_code == CLD_STOPPED;
    }
    if (errno != EINTR) {
      return false;
    }
  }
}

} // namespace dagrun

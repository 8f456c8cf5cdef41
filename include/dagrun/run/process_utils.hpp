#pragma once

#include <boost/process/v2/environment.hpp>
#include <boost/process/v2/process.hpp>

#include <signal.h>
#include <sys/types.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace dagrun {

namespace bp = boost::process::v2;

/// Truncate a command string for log preview (max 80 chars).
[[nodiscard]] inline auto cmd_preview(std::string_view cmd) -> std::string {
  if (cmd.size() <= 80)
    return std::string(cmd);
  return std::string(cmd.substr(0, 80)) + "...";
}

/// POSIX shell identifier: [A-Za-z_][A-Za-z0-9_]*. Other names still reach
/// the environment but cannot be expanded by a shell as `$NAME`.
[[nodiscard]] inline auto is_valid_env_key(std::string_view key) -> bool {
  if (key.empty())
    return false;
  if (!std::isalpha(static_cast<unsigned char>(key[0])) && key[0] != '_')
    return false;
  return std::ranges::all_of(key, [](char c) {
    const auto uc = static_cast<unsigned char>(c);
    return std::isalnum(uc) != 0 || c == '_';
  });
}

/// Inherited environment with `custom` entries layered on top.
[[nodiscard]] inline auto
build_process_env(const std::map<std::string, std::string> &custom)
    -> bp::process_environment {
  std::vector<bp::environment::key_value_pair> env_vec;
  env_vec.reserve(64);

  for (const auto &entry : bp::environment::current()) {
    auto key_sv = entry.key();
    if (custom.contains(std::string(key_sv.data(), key_sv.size()))) {
      continue;
    }
    env_vec.emplace_back(entry);
  }

  for (const auto &[k, v] : custom) {
    env_vec.emplace_back(bp::environment::key{k}, bp::environment::value{v});
  }

  return bp::process_environment(std::move(env_vec));
}

/// Launcher initializer run in the child between fork and exec: the task
/// becomes leader of its own process group (so signals can address its whole
/// subtree without reaching the caller's group) and gets the default SIGPIPE
/// disposition back, since the engine itself ignores SIGPIPE.
struct own_process_group {
  template <typename Launcher>
  auto on_exec_setup(Launcher & /*launcher*/,
                     const bp::filesystem::path & /*executable*/,
                     const char *const *& /*cmd_line*/) -> bp::error_code {
    if (::setpgid(0, 0) != 0) {
      return bp::error_code(errno, boost::system::system_category());
    }
    struct sigaction dfl {};
    dfl.sa_handler = SIG_DFL;
    ::sigemptyset(&dfl.sa_mask);
    (void)::sigaction(SIGPIPE, &dfl, nullptr);
    return {};
  }
};

/// Signal the process group led by `pid`, falling back to the process itself
/// when the group no longer exists.
inline auto signal_task(pid_t pid, int sig) noexcept -> bool {
  if (pid <= 0)
    return false;
  if (::killpg(pid, sig) == 0)
    return true;
  return ::kill(pid, sig) == 0;
}

/// Blocks until `pid` is stopped or has exited, without reaping it.
/// Returns true when the process is stopped.
[[nodiscard]] auto wait_until_suspended(pid_t pid) noexcept -> bool;

} // namespace dagrun

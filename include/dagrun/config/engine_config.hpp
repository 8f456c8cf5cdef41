#pragma once

#include <chrono>
#include <string>

namespace dagrun {

struct EngineConfig {
  std::string log_level{"warn"};
  std::string log_file;
  std::string workspace_root; // empty = system temporary directory
  std::string workspace_prefix{"dagrun"};
  int follow_poll_interval_ms{20};
  int gate_threads{2};

  [[nodiscard]] auto follow_poll_interval() const noexcept
      -> std::chrono::milliseconds {
    return std::chrono::milliseconds(follow_poll_interval_ms);
  }

  auto operator==(const EngineConfig &) const -> bool = default;
};

} // namespace dagrun

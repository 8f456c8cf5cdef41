#pragma once

#include <optional>
#include <string>

namespace dagrun::cli {

struct RunOptions {
  std::string task_file;
  std::string config_file;
  std::string output; // "" = none, "-" = stdout, else a path
  std::optional<std::string> log_level;
  std::string task;
};

struct ListOptions {
  std::string task_file;
  bool json{false};
};

struct ValidateOptions {
  std::string task_file;
  std::optional<std::string> task;
};

auto cmd_run(const RunOptions &opts) -> int;
auto cmd_list(const ListOptions &opts) -> int;
auto cmd_validate(const ValidateOptions &opts) -> int;

} // namespace dagrun::cli

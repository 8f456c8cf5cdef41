#pragma once

#include <cstdio>
#include <print>
#include <string>
#include <system_error>

namespace dagrun::cli {

inline auto report_error(const std::error_code &ec,
                         const std::string &diagnostic) -> int {
  std::println(stderr, "Error: {}",
               diagnostic.empty() ? ec.message() : diagnostic);
  return 1;
}

} // namespace dagrun::cli

#pragma once

#include <chrono>
#include <cstdio>
#include <format>
#include <print>
#include <string>
#include <string_view>
#include <unistd.h>
#include <vector>

namespace dagrun::cli::fmt {

namespace ansi {

inline auto is_tty(std::FILE *stream) noexcept -> bool {
  return ::isatty(::fileno(stream)) != 0;
}

inline constexpr std::string_view kReset = "\033[0m";
inline constexpr std::string_view kBold = "\033[1m";
inline constexpr std::string_view kDim = "\033[2m";

inline constexpr std::string_view kGreen = "\033[32m";
inline constexpr std::string_view kRed = "\033[31m";
inline constexpr std::string_view kCyan = "\033[36m";

inline auto colorize(std::string_view text, std::string_view color,
                     std::FILE *stream = stdout) -> std::string {
  if (!is_tty(stream)) {
    return std::string(text);
  }
  return std::format("{}{}{}", color, text, kReset);
}

inline auto green(std::string_view text, std::FILE *stream = stdout)
    -> std::string {
  return colorize(text, kGreen, stream);
}

inline auto red(std::string_view text, std::FILE *stream = stdout)
    -> std::string {
  return colorize(text, kRed, stream);
}

inline auto cyan(std::string_view text, std::FILE *stream = stdout)
    -> std::string {
  return colorize(text, kCyan, stream);
}

inline auto dim(std::string_view text, std::FILE *stream = stdout)
    -> std::string {
  return colorize(text, kDim, stream);
}

inline auto ansi_visible_width(std::string_view s) -> std::size_t {
  std::size_t width = 0;
  bool in_escape = false;
  for (char c : s) {
    if (in_escape) {
      if (c == 'm')
        in_escape = false;
    } else if (c == '\033') {
      in_escape = true;
    } else {
      ++width;
    }
  }
  return width;
}

} // namespace ansi

inline auto format_elapsed(std::chrono::milliseconds elapsed) -> std::string {
  if (elapsed.count() < 1000)
    return std::format("{}ms", elapsed.count());
  return std::format("{:.2f}s", static_cast<double>(elapsed.count()) / 1000.0);
}

class Table {
public:
  struct Column {
    std::string header;
    std::size_t width;
  };

  explicit Table(std::vector<Column> columns) : columns_(std::move(columns)) {}

  auto print_header() const -> void {
    std::size_t total_width = 0;
    for (std::size_t i = 0; i < columns_.size(); ++i) {
      if (i > 0)
        std::print(" ");
      std::print("{:<{}}", columns_[i].header, columns_[i].width);
      total_width += columns_[i].width;
    }
    std::println("");
    total_width += columns_.size() - 1;
    std::println("{}", std::string(total_width, '-'));
  }

  auto print_row(const std::vector<std::string> &values) const -> void {
    for (std::size_t i = 0; i < columns_.size() && i < values.size(); ++i) {
      if (i > 0)
        std::print(" ");
      const auto &val = values[i];
      auto visible = ansi::ansi_visible_width(val);
      auto pad = visible < columns_[i].width ? columns_[i].width - visible : 0;
      // Last column is not padded.
      if (i + 1 == columns_.size())
        pad = 0;
      std::print("{}{}", val, std::string(pad, ' '));
    }
    std::println("");
  }

private:
  std::vector<Column> columns_;
};

} // namespace dagrun::cli::fmt

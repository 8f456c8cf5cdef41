#pragma once

#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/system/error_code.hpp>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <format>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <unistd.h>
#include <utility>
#include <vector>

namespace dagrun::log {

enum class Level : std::uint8_t { Trace, Debug, Info, Warn, Error };

inline constexpr std::array<std::string_view, 5> level_names = {
    "trace", "debug", "info", "warn", "error"};

inline constexpr std::array<std::string_view, 5> level_colors = {
    "\o{33}[90m", // trace: gray
    "\o{33}[36m", // debug: cyan
    "\o{33}[32m", // info: green
    "\o{33}[33m", // warn: yellow
    "\o{33}[31m"  // error: red
};

[[nodiscard]] inline auto level_name(Level level) -> std::string_view {
  return level_names.at(std::to_underlying(level));
}

[[nodiscard]] inline auto level_color(Level level) -> std::string_view {
  return level_colors.at(std::to_underlying(level));
}

[[nodiscard]] inline auto parse_level(std::string_view name)
    -> std::optional<Level> {
  const auto *it = std::ranges::find(level_names, name);
  if (it == level_names.end()) {
    return std::nullopt;
  }
  return static_cast<Level>(std::distance(level_names.begin(), it));
}

// Async logger. Lines are formatted on the calling thread and handed to a
// writer thread through a Boost concurrent_channel; before start() (and after
// stop()) lines are written synchronously.
class Logger {
  static constexpr std::size_t QUEUE_CAPACITY = 4096;
  static constexpr std::size_t BATCH_SIZE = 64;
  using LogChannel = boost::asio::experimental::concurrent_channel<
      boost::asio::io_context::executor_type,
      void(boost::system::error_code, std::string)>;

  std::atomic<Level> level_{Level::Info};
  std::atomic<bool> running_{false};
  std::atomic<FILE *> output_{stderr};
  std::atomic<std::uint64_t> dropped_{0};
  FILE *file_{nullptr};
  boost::asio::io_context queue_ctx_{1};
  std::shared_ptr<LogChannel> queue_;
  std::jthread writer_;

  auto write_out(std::string_view line) -> void {
    auto *out = output_.load(std::memory_order_acquire);
    std::fwrite(line.data(), 1, line.size(), out ? out : stderr);
  }

  auto writer_loop(std::shared_ptr<LogChannel> queue) -> void {
    std::vector<std::string> batch;
    batch.reserve(BATCH_SIZE);

    while (running_.load(std::memory_order_acquire)) {
      boost::system::error_code recv_ec;
      std::optional<std::string> first;
      queue->async_receive(
          [&](const boost::system::error_code &ec, std::string item) {
            recv_ec = ec;
            if (!ec) {
              first = std::move(item);
            }
          });
      queue_ctx_.restart();
      (void)queue_ctx_.run_one();
      if (recv_ec || !first) {
        break;
      }

      batch.clear();
      batch.push_back(std::move(*first));
      while (batch.size() < BATCH_SIZE &&
             queue->try_receive(
                 [&](const boost::system::error_code &ec, std::string item) {
                   if (!ec) {
                     batch.push_back(std::move(item));
                   }
                 })) {
      }

      for (const auto &line : batch) {
        write_out(line);
      }
      std::fflush(output_.load(std::memory_order_acquire));
    }

    // Flush whatever was queued before close().
    while (queue->try_receive(
        [&](const boost::system::error_code &ec, std::string item) {
          if (!ec) {
            write_out(item);
          }
        })) {
    }
    std::fflush(output_.load(std::memory_order_acquire));
  }

  template <typename... Args>
  [[nodiscard]] static auto format_line(Level level,
                                        std::format_string<Args...> fmt,
                                        Args &&...args) -> std::string {
    auto now = std::chrono::floor<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
    auto tid =
        std::hash<std::thread::id>{}(std::this_thread::get_id()) % 1000000;
    std::string line;
    line.reserve(256);
    std::format_to(std::back_inserter(line),
                   "[{:%Y-%m-%d %H:%M:%S}] [{}{}{}] [{}] {}\n", now,
                   level_color(level), level_name(level), "\o{33}[0m", tid,
                   std::format(fmt, std::forward<Args>(args)...));
    return line;
  }

public:
  Logger() = default;
  ~Logger() {
    stop();
    if (file_) {
      std::fclose(file_);
    }
  }

  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  auto start() -> void {
    if (running_.exchange(true, std::memory_order_acq_rel))
      return;
    queue_ctx_.restart();
    queue_ =
        std::make_shared<LogChannel>(queue_ctx_.get_executor(), QUEUE_CAPACITY);
    writer_ = std::jthread([this, queue = queue_] { writer_loop(queue); });
  }

  auto stop() -> void {
    if (!running_.exchange(false, std::memory_order_acq_rel))
      return;
    if (queue_) {
      queue_->close();
    }
    if (writer_.joinable()) {
      writer_.join();
    }
    queue_.reset();
  }

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }

  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }

  auto set_output_stderr() noexcept -> void {
    output_.store(stderr, std::memory_order_release);
  }

  /// Redirect output to an append-mode file. Only valid while stopped.
  auto set_output_file(std::string_view path) -> bool {
    if (running_.load(std::memory_order_acquire)) {
      return false;
    }
    FILE *f = std::fopen(std::string(path).c_str(), "a");
    if (!f)
      return false;
    std::setvbuf(f, nullptr, _IOLBF, 0);
    output_.store(f, std::memory_order_release);
    if (file_)
      std::fclose(file_);
    file_ = f;
    return true;
  }

  [[nodiscard]] auto dropped() const noexcept -> std::uint64_t {
    return dropped_.load(std::memory_order_relaxed);
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args &&...args)
      -> void {
    if (level < level_.load(std::memory_order_acquire))
      return;

    auto line = format_line(level, fmt, std::forward<Args>(args)...);
    if (!running_.load(std::memory_order_acquire) || !queue_) {
      write_out(line);
      std::fflush(output_.load(std::memory_order_acquire));
      return;
    }
    if (!queue_->try_send(boost::system::error_code{}, std::move(line))) {
      // Never block a coordinating thread on a full queue.
      dropped_.fetch_add(1, std::memory_order_relaxed);
    }
  }
};

inline Logger &logger() {
  static Logger instance;
  return instance;
}

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

inline auto set_level(std::string_view name) noexcept -> void {
  logger().set_level(parse_level(name).value_or(Level::Info));
}

inline auto set_output_file(std::string_view path) -> bool {
  return logger().set_output_file(path);
}

inline auto set_output_stderr() noexcept -> void {
  logger().set_output_stderr();
}

inline auto start() -> void { logger().start(); }
inline auto stop() -> void { logger().stop(); }

template <typename... Args>
auto trace(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Trace, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Error, fmt, std::forward<Args>(args)...);
}

} // namespace dagrun::log

#pragma once

#include "dagrun/core/coroutine.hpp"
#include "dagrun/core/error.hpp"
#include "dagrun/util/id.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/readable_pipe.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/writable_pipe.hpp>

#include <ankerl/unordered_dense.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <vector>

namespace dagrun {

/// Forwards a producer's growing output slot into a consumer's stdin pipe.
/// Reads from offset 0, polls for growth while the producer runs, and on
/// detach() drains the rest of the slot and closes the pipe.
class StreamFollower : public std::enable_shared_from_this<StreamFollower> {
  struct PrivateTag {
    explicit PrivateTag() = default;
  };

public:
  struct Attachment {
    std::shared_ptr<StreamFollower> follower;
    /// Becomes the consumer's stdin; the caller closes its copy after spawn.
    boost::asio::readable_pipe consumer_end;
  };

  [[nodiscard]] static auto attach(boost::asio::any_io_executor executor,
                                   TaskId producer, TaskId consumer,
                                   const std::filesystem::path &source,
                                   std::chrono::milliseconds poll_interval,
                                   std::string *diagnostic = nullptr)
      -> Result<Attachment>;

  /// Use attach(); the tag keeps construction inside the class.
  StreamFollower(PrivateTag, boost::asio::any_io_executor executor,
                 TaskId producer, TaskId consumer, int source_fd,
                 std::chrono::milliseconds poll_interval);
  ~StreamFollower();

  StreamFollower(const StreamFollower &) = delete;
  StreamFollower &operator=(const StreamFollower &) = delete;

  /// The producer has completed: forward what is left, then signal EOF.
  auto detach() -> void;

  [[nodiscard]] auto producer() const noexcept -> const TaskId & {
    return producer_;
  }
  [[nodiscard]] auto consumer() const noexcept -> const TaskId & {
    return consumer_;
  }
  [[nodiscard]] auto bytes_forwarded() const noexcept -> std::uint64_t {
    return forwarded_;
  }
  [[nodiscard]] auto finished() const noexcept -> bool { return finished_; }

private:
  [[nodiscard]] auto pump() -> task<void>;

  TaskId producer_;
  TaskId consumer_;
  int source_fd_;
  std::chrono::milliseconds poll_interval_;
  boost::asio::writable_pipe sink_;
  boost::asio::steady_timer poll_timer_;
  bool detach_requested_{false};
  bool finished_{false};
  std::uint64_t forwarded_{0};
};

/// Followers keyed by producer; one producer may feed several consumers.
class FollowerRegistry {
public:
  auto add(std::shared_ptr<StreamFollower> follower) -> void;

  /// Detach every follower fed by `producer`; returns how many.
  auto detach_all(const TaskId &producer) -> std::size_t;

  [[nodiscard]] auto size() const noexcept -> std::size_t { return count_; }

private:
  ankerl::unordered_dense::map<TaskId,
                               std::vector<std::shared_ptr<StreamFollower>>>
      by_producer_;
  std::size_t count_{0};
};

} // namespace dagrun

#include "dagrun/run/stream_follower.hpp"

#include "dagrun/core/asio_awaitable.hpp"
#include "dagrun/util/log.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/connect_pipe.hpp>
#include <boost/asio/write.hpp>
#include <boost/system/system_error.hpp>

#include <array>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <unistd.h>
#include <utility>

namespace dagrun {

namespace {

inline constexpr std::size_t kChunkSize = 64UZ * 1024;

auto set_cloexec(int fd) noexcept -> void {
  const int flags = ::fcntl(fd, F_GETFD);
  if (flags >= 0) {
    (void)::fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
  }
}

} // namespace

StreamFollower::StreamFollower(PrivateTag,
                               boost::asio::any_io_executor executor,
                               TaskId producer, TaskId consumer, int source_fd,
                               std::chrono::milliseconds poll_interval)
    : producer_(std::move(producer)), consumer_(std::move(consumer)),
      source_fd_(source_fd), poll_interval_(poll_interval), sink_(executor),
      poll_timer_(executor) {}

StreamFollower::~StreamFollower() {
  if (source_fd_ >= 0) {
    ::close(source_fd_);
  }
}

auto StreamFollower::attach(boost::asio::any_io_executor executor,
                            TaskId producer, TaskId consumer,
                            const std::filesystem::path &source,
                            std::chrono::milliseconds poll_interval,
                            std::string *diagnostic) -> Result<Attachment> {
  const int fd = ::open(source.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    const auto err = errno;
    set_diagnostic(diagnostic,
                   std::format("cannot open output of '{}' for streaming: {}",
                               producer, std::strerror(err)));
    return fail(std::error_code(err, std::system_category()));
  }

  auto follower = std::make_shared<StreamFollower>(
      PrivateTag{}, executor, std::move(producer), std::move(consumer), fd,
      poll_interval);
  boost::asio::readable_pipe consumer_end(executor);

  boost::system::error_code ec;
  boost::asio::connect_pipe(consumer_end, follower->sink_, ec);
  if (ec) {
    set_diagnostic(diagnostic,
                   std::format("cannot create stdin pipe for '{}': {}",
                               follower->consumer_, ec.message()));
    return fail(Error::ProcessSpawnFailed);
  }
  set_cloexec(consumer_end.native_handle());
  set_cloexec(follower->sink_.native_handle());

  co_spawn(executor,
           [self = follower]() -> task<void> { co_await self->pump(); },
           detached);

  log::debug("following output of '{}' into stdin of '{}'",
             follower->producer_, follower->consumer_);
  return Attachment{.follower = std::move(follower),
                    .consumer_end = std::move(consumer_end)};
}

auto StreamFollower::detach() -> void {
  if (detach_requested_) {
    return;
  }
  detach_requested_ = true;
  poll_timer_.cancel();
}

auto StreamFollower::pump() -> task<void> {
  std::array<char, kChunkSize> buffer{};
  for (;;) {
    const auto n = ::read(source_fd_, buffer.data(), buffer.size());
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      log::error("reading output of '{}' failed: {}", producer_,
                 std::strerror(errno));
      break;
    }
    if (n > 0) {
      auto [ec, written] = co_await boost::asio::async_write(
          sink_, boost::asio::buffer(buffer.data(), static_cast<std::size_t>(n)),
          use_nothrow);
      if (ec) {
        // Consumer closed its stdin or was terminated.
        log::debug("stdin of '{}' closed after {} bytes: {}", consumer_,
                   forwarded_, ec.message());
        break;
      }
      forwarded_ += written;
      continue;
    }
    // End of what the producer has written so far.
    if (detach_requested_) {
      break;
    }
    poll_timer_.expires_after(poll_interval_);
    auto [ec] = co_await poll_timer_.async_wait(use_nothrow);
    (void)ec;
  }

  boost::system::error_code ignored;
  sink_.close(ignored);
  ::close(source_fd_);
  source_fd_ = -1;
  finished_ = true;
  log::debug("stopped following '{}' into '{}' ({} bytes)", producer_,
             consumer_, forwarded_);
}

auto FollowerRegistry::add(std::shared_ptr<StreamFollower> follower) -> void {
  auto key = follower->producer();
  by_producer_[std::move(key)].push_back(std::move(follower));
  ++count_;
}

auto FollowerRegistry::detach_all(const TaskId &producer) -> std::size_t {
  auto it = by_producer_.find(producer);
  if (it == by_producer_.end()) {
    return 0;
  }
  auto followers = std::move(it->second);
  by_producer_.erase(it);
  for (const auto &follower : followers) {
    follower->detach();
  }
  count_ -= followers.size();
  return followers.size();
}

} // namespace dagrun

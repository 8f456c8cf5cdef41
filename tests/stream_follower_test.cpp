#include "dagrun/core/asio_awaitable.hpp"
#include "dagrun/run/stream_follower.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <boost/asio/buffer.hpp>
#include <boost/asio/io_context.hpp>

#include <array>
#include <fstream>
#include <type_traits>

using namespace dagrun;
using namespace std::chrono_literals;

namespace {

auto read_some(boost::asio::readable_pipe &pipe, std::string &out)
    -> task<bool> {
  std::array<char, 256> buf{};
  auto [ec, n] = co_await pipe.async_read_some(
      boost::asio::buffer(buf.data(), buf.size()), use_nothrow);
  if (ec) {
    co_return false;
  }
  out.append(buf.data(), n);
  co_return true;
}

} // namespace

class StreamFollowerTest : public ::testing::Test {
protected:
  boost::asio::io_context io_;
  dagrun::test::TempDir dir_;
};

TEST_F(StreamFollowerTest, ForwardsGrowthThenDrainsOnDetach) {
  const auto source = dir_ / "P.out";
  dagrun::test::write_file(source, "first\n");

  auto attached = StreamFollower::attach(io_.get_executor(), TaskId("P"),
                                         TaskId("C"), source, 5ms);
  ASSERT_TRUE(attached.has_value());
  auto follower = attached->follower;
  auto pipe = std::move(attached->consumer_end);

  auto received = dagrun::test::run_coro(
      io_, [&]() -> task<std::string> {
        std::string out;
        while (out.find("first\n") == std::string::npos) {
          if (!co_await read_some(pipe, out)) {
            co_return out;
          }
        }
        {
          std::ofstream append(source, std::ios::app);
          append << "second\n";
        }
        follower->detach();
        while (co_await read_some(pipe, out)) {
        }
        co_return out;
      }());

  EXPECT_EQ(received, "first\nsecond\n");
  EXPECT_TRUE(follower->finished());
  EXPECT_EQ(follower->bytes_forwarded(), received.size());
}

TEST_F(StreamFollowerTest, EmptyProducerGivesImmediateEofAfterDetach) {
  const auto source = dir_ / "P.out";
  dagrun::test::write_file(source, "");

  auto attached = StreamFollower::attach(io_.get_executor(), TaskId("P"),
                                         TaskId("C"), source, 5ms);
  ASSERT_TRUE(attached.has_value());
  auto follower = attached->follower;
  auto pipe = std::move(attached->consumer_end);
  follower->detach();

  auto received = dagrun::test::run_coro(io_, [&]() -> task<std::string> {
    std::string out;
    while (co_await read_some(pipe, out)) {
    }
    co_return out;
  }());
  EXPECT_TRUE(received.empty());
  EXPECT_TRUE(follower->finished());
}

TEST_F(StreamFollowerTest, ClosedConsumerEndsForwardSilently) {
  const auto source = dir_ / "P.out";
  dagrun::test::write_file(source, "payload\n");

  auto attached = StreamFollower::attach(io_.get_executor(), TaskId("P"),
                                         TaskId("C"), source, 5ms);
  ASSERT_TRUE(attached.has_value());
  auto follower = attached->follower;
  attached->consumer_end.close();

  io_.run_for(2s);
  EXPECT_TRUE(follower->finished());
  EXPECT_EQ(follower->bytes_forwarded(), 0U);
}

static_assert(!std::is_constructible_v<StreamFollower,
                                       boost::asio::any_io_executor, TaskId,
                                       TaskId, int, std::chrono::milliseconds>);

TEST_F(StreamFollowerTest, AttachReturnsSharedOwnedFollower) {
  const auto source = dir_ / "P.out";
  dagrun::test::write_file(source, "x\n");

  auto attached = StreamFollower::attach(io_.get_executor(), TaskId("P"),
                                         TaskId("C"), source, 5ms);
  ASSERT_TRUE(attached.has_value());
  auto follower = attached->follower;
  ASSERT_NE(follower, nullptr);
  EXPECT_EQ(follower->weak_from_this().lock(), follower);
  EXPECT_EQ(follower->producer(), TaskId("P"));
  EXPECT_EQ(follower->consumer(), TaskId("C"));

  attached->consumer_end.close();
  follower->detach();
  io_.run_for(2s);
  EXPECT_TRUE(follower->finished());
}

TEST_F(StreamFollowerTest, MissingSourceFails) {
  std::string diagnostic;
  auto attached =
      StreamFollower::attach(io_.get_executor(), TaskId("P"), TaskId("C"),
                             dir_ / "absent.out", 5ms, &diagnostic);
  EXPECT_FALSE(attached.has_value());
  EXPECT_NE(diagnostic.find("'P'"), std::string::npos);
}

TEST_F(StreamFollowerTest, RegistryDetachesEveryConsumerOfAProducer) {
  const auto source = dir_ / "P.out";
  dagrun::test::write_file(source, "shared\n");

  FollowerRegistry registry;
  std::vector<boost::asio::readable_pipe> pipes;
  for (const auto *consumer : {"C1", "C2"}) {
    auto attached = StreamFollower::attach(io_.get_executor(), TaskId("P"),
                                           TaskId(consumer), source, 5ms);
    ASSERT_TRUE(attached.has_value());
    registry.add(attached->follower);
    pipes.push_back(std::move(attached->consumer_end));
  }
  EXPECT_EQ(registry.size(), 2);
  EXPECT_EQ(registry.detach_all(TaskId("other")), 0);
  EXPECT_EQ(registry.detach_all(TaskId("P")), 2);
  EXPECT_EQ(registry.detach_all(TaskId("P")), 0);
  EXPECT_EQ(registry.size(), 0);

  std::array<std::string, 2> received;
  auto done = dagrun::test::run_coro(io_, [&]() -> task<bool> {
    for (std::size_t i = 0; i < pipes.size(); ++i) {
      while (co_await read_some(pipes[i], received[i])) {
      }
    }
    co_return true;
  }());
  EXPECT_TRUE(done);
  EXPECT_EQ(received[0], "shared\n");
  EXPECT_EQ(received[1], "shared\n");
}

#include <gtest/gtest.h>

#include <chrono>
#include <csignal>
#include <mutex>
#include <thread>

#include "server/signal_handler.hpp"

using namespace docpipe;
using namespace std::chrono_literals;

namespace {

class SignalHandlerTest : public ::testing::Test {
 protected:
  void SetUp() override { server_context().stop_requested.store(false); }
  void TearDown() override { server_context().stop_requested.store(false); }
};

}  // namespace

TEST_F(SignalHandlerTest, SignalSetsStopFlag)
{
  signal_handler(SIGTERM);
  EXPECT_TRUE(server_context().stop_requested.load());
}

TEST_F(SignalHandlerTest, RequestStopWakesWaiters)
{
  auto& ctx = server_context();
  bool woke = false;
  std::jthread waiter([&ctx, &woke] {
    std::unique_lock lock(ctx.stop_mutex);
    woke = ctx.stop_cv.wait_for(
        lock, 5s, [&ctx] { return ctx.stop_requested.load(); });
  });
  std::this_thread::sleep_for(10ms);
  request_server_stop();
  waiter.join();
  EXPECT_TRUE(woke);
}

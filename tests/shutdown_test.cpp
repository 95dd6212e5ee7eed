// Unit tests for textscrub/shutdown.hpp
// Tests: Callback ordering, idempotence, signal delivery

#include <gtest/gtest.h>

#include <textscrub/shutdown.hpp>

#include <atomic>
#include <csignal>
#include <thread>
#include <vector>

namespace textscrub {
namespace {

// =============================================================================
// Shutdown Tests
// =============================================================================

class ShutdownTest : public ::testing::Test {};

TEST_F(ShutdownTest, CallbacksRunInRegistrationOrder) {
  ShutdownHandler handler;
  std::vector<int> order;
  handler.OnShutdown([&]() { order.push_back(1); });
  handler.OnShutdown([&]() { order.push_back(2); });
  handler.OnShutdown([&]() { order.push_back(3); });

  EXPECT_FALSE(handler.IsShutdownRequested());
  EXPECT_TRUE(handler.Shutdown());
  EXPECT_TRUE(handler.IsShutdownRequested());
  EXPECT_EQ(order, std::vector<int>({1, 2, 3}));
}

TEST_F(ShutdownTest, SecondShutdownIsNoop) {
  ShutdownHandler handler;
  int calls = 0;
  handler.OnShutdown([&]() { ++calls; });

  EXPECT_TRUE(handler.Shutdown());
  EXPECT_FALSE(handler.Shutdown());
  EXPECT_EQ(calls, 1);
}

TEST_F(ShutdownTest, DestructorRunsPendingCallbacks) {
  int calls = 0;
  {
    ShutdownHandler handler;
    handler.OnShutdown([&]() { ++calls; });
  }
  EXPECT_EQ(calls, 1);
}

TEST_F(ShutdownTest, ConcurrentShutdownRunsOnce) {
  ShutdownHandler handler;
  std::atomic<int> calls{0};
  std::atomic<int> winners{0};
  handler.OnShutdown([&]() { calls.fetch_add(1); });

  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&]() {
      if (handler.Shutdown()) winners.fetch_add(1);
    });
  }
  for (auto& thread : threads) thread.join();

  EXPECT_EQ(calls.load(), 1);
  EXPECT_EQ(winners.load(), 1);
}

TEST_F(ShutdownTest, WaitForShutdownReturnsAfterTrigger) {
  ShutdownHandler handler;
  std::thread trigger([&]() { handler.Shutdown(); });
  handler.WaitForShutdown();
  trigger.join();
  EXPECT_TRUE(handler.IsShutdownRequested());
}

TEST_F(ShutdownTest, SigtermTriggersShutdown) {
  ShutdownHandler handler;
  std::atomic<bool> ran{false};
  handler.OnShutdown([&]() { ran.store(true); });

  ASSERT_TRUE(handler.InstallSignalHandlers());
  std::raise(SIGTERM);
  handler.WaitForShutdown();
  handler.RestoreSignalHandlers();

  EXPECT_TRUE(ran.load());
  EXPECT_TRUE(handler.IsShutdownRequested());
  EXPECT_EQ(handler.signal_received(), SIGTERM);
}

TEST_F(ShutdownTest, ProgrammaticShutdownHasNoSignal) {
  ShutdownHandler handler;
  ASSERT_TRUE(handler.InstallSignalHandlers());
  EXPECT_TRUE(handler.Shutdown());
  handler.RestoreSignalHandlers();
  EXPECT_EQ(handler.signal_received(), 0);
}

TEST_F(ShutdownTest, OnlyOneHandlerOwnsSignals) {
  ShutdownHandler first;
  ShutdownHandler second;
  ASSERT_TRUE(first.InstallSignalHandlers());
  EXPECT_FALSE(second.InstallSignalHandlers());
  first.RestoreSignalHandlers();
  EXPECT_TRUE(second.InstallSignalHandlers());
  second.RestoreSignalHandlers();
}

TEST_F(ShutdownTest, LateCallbacksAreDropped) {
  ShutdownHandler handler;
  int calls = 0;
  handler.Shutdown();
  handler.OnShutdown([&]() { ++calls; });
  handler.Shutdown();
  EXPECT_EQ(calls, 0);
}

}  // namespace
}  // namespace textscrub

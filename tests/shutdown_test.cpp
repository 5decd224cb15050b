// Unit tests for peerrec/shutdown.hpp
// Tests: hook ordering, store close after hooks, idempotence, signals

#include <gtest/gtest.h>

#include <peerrec/shutdown.hpp>
#include <peerrec/test_utils.hpp>

#include <atomic>
#include <csignal>
#include <string>
#include <thread>
#include <vector>

namespace peerrec {
namespace {

class ShutdownTest : public testing::StoreFixture {};

// =============================================================================
// Ordering
// =============================================================================

TEST_F(ShutdownTest, HooksRunInOrderBeforeStoresClose) {
  ASSERT_TRUE(OpenStore().ok());

  ShutdownHandler handler;
  handler.RegisterStore(store_.get());

  std::vector<std::string> ran;
  bool store_open_in_hook = false;
  handler.OnShutdown("stop-listener", [&] { ran.push_back("stop-listener"); });
  handler.OnShutdown("drain", [&] {
    ran.push_back("drain");
    uint64_t count = 0;
    store_open_in_hook = store_->CountVideos(&count).ok();
  });

  EXPECT_EQ(handler.HookNames(), (std::vector<std::string>{"stop-listener", "drain"}));
  EXPECT_FALSE(handler.IsShutdownRequested());

  EXPECT_TRUE(handler.Shutdown());
  EXPECT_TRUE(handler.IsShutdownRequested());
  EXPECT_EQ(ran, (std::vector<std::string>{"stop-listener", "drain"}));
  EXPECT_TRUE(store_open_in_hook);

  uint64_t count = 0;
  EXPECT_TRUE(store_->CountVideos(&count).IsInvalidArgument());
}

TEST_F(ShutdownTest, SecondShutdownIsNoOp) {
  ASSERT_TRUE(OpenStore().ok());

  ShutdownHandler handler;
  int calls = 0;
  handler.OnShutdown("count", [&] { ++calls; });

  EXPECT_TRUE(handler.Shutdown());
  EXPECT_FALSE(handler.Shutdown());
  EXPECT_EQ(calls, 1);
  handler.WaitForShutdown();
}

TEST_F(ShutdownTest, UnregisteredStoreStaysOpen) {
  ASSERT_TRUE(OpenStore().ok());

  ShutdownHandler handler;
  handler.RegisterStore(store_.get());
  handler.UnregisterStore(store_.get());
  EXPECT_TRUE(handler.Shutdown());

  uint64_t count = 0;
  EXPECT_TRUE(store_->CountVideos(&count).ok());
}

TEST_F(ShutdownTest, ConcurrentCallersRunHooksOnce) {
  ShutdownHandler handler;
  std::atomic<int> calls{0};
  handler.OnShutdown("count", [&] { calls.fetch_add(1); });

  testing::TestResultCollector results;
  std::vector<std::thread> threads;
  for (int i = 0; i < 4; ++i) {
    threads.emplace_back([&] {
      if (handler.Shutdown()) {
        results.RecordSuccess();
      } else {
        results.RecordFailure();
      }
    });
  }
  for (auto& t : threads) t.join();

  EXPECT_EQ(calls.load(), 1);
  EXPECT_EQ(results.SuccessCount(), 1u);
  EXPECT_EQ(results.FailureCount(), 3u);
}

// =============================================================================
// Signals
// =============================================================================

TEST_F(ShutdownTest, SignalTriggersShutdown) {
  ShutdownHandler handler;
  bool ran = false;
  handler.OnShutdown("flag", [&] { ran = true; });
  ASSERT_TRUE(handler.InstallSignalHandlers());

  std::raise(SIGHUP);
  handler.WaitForShutdown();

  EXPECT_TRUE(ran);
  EXPECT_EQ(handler.ReceivedSignal(), SIGHUP);
  handler.RestoreSignalHandlers();
}

}  // namespace
}  // namespace peerrec

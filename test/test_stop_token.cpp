#include <gtest/gtest.h>
#include <memory>
#include <thread>
#include <vector>
#include "stoplight/stop_token.hpp"

class StopTokenTest : public ::testing::Test {
 protected:
  stoplight::stop_source test_source;
};

/// Tests that a fresh signal has no stop requested.
TEST_F(StopTokenTest, TestInitiallyUnset) {
  EXPECT_FALSE(test_source.stop_requested());
  EXPECT_FALSE(test_source.get_token().stop_requested());
}

/// Tests that a stop request is visible through every token of the signal.
TEST_F(StopTokenTest, TestRequestStop) {
  auto token = test_source.get_token();
  test_source.request_stop();
  EXPECT_TRUE(token.stop_requested());
  EXPECT_TRUE(test_source.get_token().stop_requested());
}

/// Tests that only the first request reports the transition and the state
/// stays set afterwards.
TEST_F(StopTokenTest, TestRequestStopIdempotent) {
  EXPECT_TRUE(test_source.request_stop());
  EXPECT_FALSE(test_source.request_stop());
  EXPECT_FALSE(test_source.request_stop());
  EXPECT_TRUE(test_source.stop_requested());
}

/// Tests that a token keeps its signal alive after the source is gone.
TEST_F(StopTokenTest, TestTokenOutlivesSource) {
  auto signal = std::make_shared<stoplight::stop_signal>();
  std::weak_ptr<stoplight::stop_signal> observer = signal;

  auto token = [&] {
    stoplight::stop_source source(std::move(signal));
    source.request_stop();
    return source.get_token();
  }();

  EXPECT_FALSE(observer.expired());
  EXPECT_TRUE(token.stop_requested());
}

/// Tests that separate sources do not share a stop state.
TEST_F(StopTokenTest, TestIndependentSources) {
  stoplight::stop_source other;
  other.request_stop();
  EXPECT_TRUE(other.stop_requested());
  EXPECT_FALSE(test_source.stop_requested());
}

/// Tests that a source without a stop_signal never reports a stop.
TEST_F(StopTokenTest, TestSourceWithoutSignal) {
  stoplight::stop_source empty(nullptr);
  EXPECT_FALSE(empty.request_stop());
  EXPECT_FALSE(empty.stop_requested());
  EXPECT_FALSE(empty.get_token().stop_requested());
}

/// Tests that a stop requested on one thread is observed by polling threads,
/// and never reads as unset again once observed.
TEST_F(StopTokenTest, TestVisibleAcrossThreads) {
  std::vector<std::thread> threads;
  for (std::size_t i = 0; i < 8; ++i) {
    threads.emplace_back([token = test_source.get_token()] {
      while (!token.stop_requested()) {
        std::this_thread::yield();
      }
      for (int read = 0; read < 1000; ++read) {
        EXPECT_TRUE(token.stop_requested());
      }
    });
  }

  test_source.request_stop();

  for (auto& thread : threads) {
    thread.join();
  }
}

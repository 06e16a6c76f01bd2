/**
 * @file logger_test.cpp
 * @author Carlos Salguero
 * @brief Logger singleton and level parsing tests
 * @version 0.1
 * @date 2025-09-14
 *
 * @copyright Copyright (c) 2025
 *
 */

#include <gtest/gtest.h>
#include <wwnlookup/core/logger.hpp>

#include <atomic>
#include <thread>
#include <vector>

using namespace wwnlookup;

// =============================================================================
// Singleton
// =============================================================================

TEST(LoggerTest, ConcurrentFirstUseSharesOneInstance) {
  constexpr int thread_count = 8;

  std::atomic<bool> go{false};
  std::vector<core::Logger *> seen(thread_count, nullptr);
  std::vector<std::thread> threads;

  for (int i = 0; i < thread_count; ++i) {
    threads.emplace_back([&, i] {
      while (!go.load(std::memory_order_acquire)) {
        std::this_thread::yield();
      }

      auto &logger = core::Logger::instance();
      logger.debug("logger thread {}", i);
      seen[static_cast<std::size_t>(i)] = &logger;
    });
  }

  go.store(true, std::memory_order_release);
  for (auto &thread : threads) {
    thread.join();
  }

  for (auto *logger : seen) {
    EXPECT_EQ(logger, seen.front());
  }

  EXPECT_EQ(&core::Logger::instance(), seen.front());
}

TEST(LoggerTest, MacrosLogThroughSharedInstance) {
  WL_DEBUG(core::LogContext{}.with("key", "value").with("count", 3),
           "structured {}", "message");
  WL_INFO("plain message");

  EXPECT_TRUE(core::Logger::instance().should_log(core::LogLevel::Critical));
  EXPECT_FALSE(core::Logger::instance().should_log(core::LogLevel::Off));
}

// =============================================================================
// Level names
// =============================================================================

TEST(LogLevelTest, ParsesKnownNames) {
  EXPECT_EQ(core::parse_log_level("trace").value(), core::LogLevel::Trace);
  EXPECT_EQ(core::parse_log_level("debug").value(), core::LogLevel::Debug);
  EXPECT_EQ(core::parse_log_level("info").value(), core::LogLevel::Info);
  EXPECT_EQ(core::parse_log_level("warn").value(), core::LogLevel::Warning);
  EXPECT_EQ(core::parse_log_level("warning").value(), core::LogLevel::Warning);
  EXPECT_EQ(core::parse_log_level("error").value(), core::LogLevel::Error);
  EXPECT_EQ(core::parse_log_level("critical").value(), core::LogLevel::Critical);
  EXPECT_EQ(core::parse_log_level("off").value(), core::LogLevel::Off);
}

TEST(LogLevelTest, UnknownNameIsConfigurationError) {
  auto level = core::parse_log_level("verbose");

  ASSERT_FALSE(level.has_value());
  EXPECT_EQ(level.error().category, utils::ErrorCategory::Configuration);
}

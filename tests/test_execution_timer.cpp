#include "splice/logging.hpp"
#include "splice/utilities/execution_timer.hpp"

#include <gtest/gtest.h>
#include <chrono>
#include <string>
#include <thread>

namespace {

using namespace std::chrono_literals;


TEST(ExecutionTimerTest, FormatDuration) {
  EXPECT_EQ(spl::format_duration(1500ns), "1.500 μs");
  EXPECT_EQ(spl::format_duration(2500us), "2.500 ms");
  EXPECT_EQ(spl::format_duration(3s), "3.000 s");
}

// Test that a timer created without auto-start only counts while running
TEST(ExecutionTimerTest, StartStop) {
  spl::execution_timer timer {"timer-test-manual", false};
  EXPECT_EQ(timer.elapsed(), 0ns);

  std::this_thread::sleep_for(1ms);
  timer.stop();
  EXPECT_EQ(timer.elapsed(), 0ns);

  timer.start();
  std::this_thread::sleep_for(1ms);
  timer.stop();
  const std::chrono::nanoseconds first = timer.elapsed();
  EXPECT_GE(first, 1ms);

  // Elapsed time accumulates over runs
  timer.start();
  std::this_thread::sleep_for(1ms);
  timer.stop();
  EXPECT_GE(timer.elapsed(), first + 1ms);
}

// Test the per-phase summary
TEST(ExecutionTimerTest, GlobalStats) {
  {
    spl::execution_timer _ {"timer-test-scoped"};
  }
  {
    spl::execution_timer _ {"timer-test-scoped"};
  }

  const enum spl::loglevel saved = spl::loglevel;
  spl::loglevel = spl::loglevel::info;
  testing::internal::CaptureStderr();
  spl::execution_timer::report_global_stats();
  const std::string log = testing::internal::GetCapturedStderr();
  spl::loglevel = saved;

  const size_t line = log.find("timer-test-scoped");
  ASSERT_NE(line, std::string::npos);
  EXPECT_NE(log.find("runs: 2", line), std::string::npos);
}

} // anonymous namespace

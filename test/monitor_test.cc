#include "monitor/cpu_time.h"
#include "monitor/wall_clock.h"
#include "sandbox/error.h"
#include <gtest/gtest.h>
#include <chrono>

namespace jsbox {
namespace {

using namespace std::chrono_literals;
using monitor_clock = MonitorFuture::clock_t;

TEST(WallClockMonitorTest, FiresAtDeadline) {
	WallClockMonitor monitor{100ms};
	EXPECT_STREQ(monitor.Name(), "wall-clock");
	auto future = monitor.GetMonitor();
	auto now = monitor_clock::now();
	auto next = future->Poll(now);
	ASSERT_TRUE(next);
	EXPECT_GT(*next, now);
	EXPECT_FALSE(future->Poll(now + 200ms));
}

TEST(WallClockMonitorTest, ZeroTimeout) {
	EXPECT_THROW(WallClockMonitor{0ms}, ConfigurationError);
}

TEST(CpuTimeMonitorTest, ReadsThisThread) {
	CpuTimeMonitor monitor{1s};
	EXPECT_STREQ(monitor.Name(), "cpu-time");
	auto future = monitor.GetMonitor();
	// Hardly any CPU time has been used since the monitor started
	EXPECT_TRUE(future->Poll(monitor_clock::now()));
	EXPECT_THROW(CpuTimeMonitor{0ns}, ConfigurationError);
}

TEST(CpuTimeFutureTest, FiresAtBudget) {
	uint64_t cpu = 1000;
	detail::CpuTimeFuture future{[&]() -> std::optional<uint64_t> { return cpu; }, 1000, 1000 + 50'000'000, 50ms};
	auto now = monitor_clock::now();
	auto next = future.Poll(now);
	ASSERT_TRUE(next);
	// Far from the deadline the poll interval is capped
	EXPECT_EQ(*next, now + std::chrono::duration_cast<monitor_clock::duration>(detail::CpuTimeFuture::kMaxPollInterval));

	cpu = 1000 + 49'900'000;
	next = future.Poll(now);
	ASSERT_TRUE(next);
	EXPECT_EQ(*next, now + std::chrono::duration_cast<monitor_clock::duration>(detail::CpuTimeFuture::kMinPollInterval));

	cpu = 1000 + 50'000'000;
	EXPECT_FALSE(future.Poll(now));
}

TEST(CpuTimeFutureTest, ReadFailureFires) {
	detail::CpuTimeFuture future{[]() -> std::optional<uint64_t> { return std::nullopt; }, 0, 1'000'000'000, 1s};
	EXPECT_FALSE(future.Poll(monitor_clock::now()));
}

} // anonymous namespace
} // namespace jsbox

#include "lib/poll_runtime.h"
#include "monitor/runtime.h"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

namespace jsbox {
namespace {

using namespace std::chrono_literals;

class CountingTask final : public poll_runtime_t::task_t {
	public:
		CountingTask(std::atomic<int>& polls, int finish_after) : polls{polls}, finish_after{finish_after} {}

		auto poll(poll_runtime_t::clock_t::time_point now) -> std::optional<poll_runtime_t::clock_t::time_point> final {
			if (++polls >= finish_after) {
				return std::nullopt;
			}
			return now + 1ms;
		}

	private:
		std::atomic<int>& polls;
		int finish_after;
};

// Asks to be polled again much later, like a long wall-clock race
class SleepyTask final : public poll_runtime_t::task_t {
	public:
		explicit SleepyTask(std::atomic<int>& polls) : polls{polls} {}

		auto poll(poll_runtime_t::clock_t::time_point now) -> std::optional<poll_runtime_t::clock_t::time_point> final {
			++polls;
			return now + 1h;
		}

	private:
		std::atomic<int>& polls;
};

template <class Predicate>
auto WaitFor(Predicate predicate) -> bool {
	auto give_up = std::chrono::steady_clock::now() + 5s;
	while (!predicate()) {
		if (std::chrono::steady_clock::now() > give_up) {
			return false;
		}
		std::this_thread::sleep_for(1ms);
	}
	return true;
}

TEST(PollRuntimeTest, RunsTaskToCompletion) {
	poll_runtime_t runtime{2, "test-poll"};
	EXPECT_EQ(runtime.size(), 2U);
	std::atomic<int> polls{0};
	auto handle = runtime.spawn(std::make_unique<CountingTask>(polls, 3));
	EXPECT_TRUE(WaitFor([&]() { return handle.finished(); }));
	EXPECT_EQ(polls, 3);
}

TEST(PollRuntimeTest, DroppingHandleAborts) {
	poll_runtime_t runtime{1, "test-poll"};
	std::atomic<int> polls{0};
	{
		auto handle = runtime.spawn(std::make_unique<CountingTask>(polls, 1000000));
		EXPECT_TRUE(WaitFor([&]() { return polls > 0; }));
	}
	int stopped_at = polls;
	std::this_thread::sleep_for(20ms);
	EXPECT_EQ(polls, stopped_at);
}

TEST(PollRuntimeTest, AbortedTasksLeaveTheQueue) {
	poll_runtime_t runtime{2, "test-poll"};
	for (int ii = 0; ii < 1000; ++ii) {
		std::atomic<int> polls{0};
		auto handle = runtime.spawn(std::make_unique<SleepyTask>(polls));
		ASSERT_TRUE(WaitFor([&]() { return polls > 0; }));
		EXPECT_TRUE(WaitFor([&]() { return runtime.pending() == 1; }));
	}
	EXPECT_EQ(runtime.pending(), 0U);

	std::atomic<int> polls{0};
	poll_runtime_t::handle_t kept = runtime.spawn(std::make_unique<SleepyTask>(polls));
	{
		auto dropped = runtime.spawn(std::make_unique<SleepyTask>(polls));
	}
	EXPECT_TRUE(WaitFor([&]() { return polls >= 1 && runtime.pending() == 1; }));
	kept.abort();
	EXPECT_EQ(runtime.pending(), 0U);
}

TEST(PollRuntimeTest, HandleOutlivesRuntime) {
	std::atomic<int> polls{0};
	poll_runtime_t::handle_t handle;
	{
		poll_runtime_t runtime{1, "test-poll"};
		handle = runtime.spawn(std::make_unique<CountingTask>(polls, 1000000));
	}
	handle.abort();
	EXPECT_TRUE(handle.finished());
}

TEST(MonitorRuntimeTest, ThreadCount) {
	EXPECT_EQ(MonitorThreadCount(nullptr), kDefaultMonitorThreads);
	EXPECT_EQ(MonitorThreadCount(""), kDefaultMonitorThreads);
	EXPECT_EQ(MonitorThreadCount("4"), 4U);
	EXPECT_EQ(MonitorThreadCount("0"), kDefaultMonitorThreads);
	EXPECT_EQ(MonitorThreadCount("-3"), kDefaultMonitorThreads);
	EXPECT_EQ(MonitorThreadCount("two"), kDefaultMonitorThreads);
	EXPECT_EQ(MonitorThreadCount("3x"), kDefaultMonitorThreads);
}

TEST(MonitorRuntimeTest, FailureIsCached) {
	int attempts = 0;
	LazyMonitorRuntime runtime{[&]() -> std::unique_ptr<poll_runtime_t> {
		++attempts;
		throw std::runtime_error("no threads");
	}};
	EXPECT_EQ(runtime.Get(), nullptr);
	EXPECT_EQ(runtime.Get(), nullptr);
	EXPECT_EQ(attempts, 1);
}

TEST(MonitorRuntimeTest, CreatedOnce) {
	int attempts = 0;
	LazyMonitorRuntime runtime{[&]() {
		++attempts;
		return std::make_unique<poll_runtime_t>(1, "test-poll");
	}};
	auto* first = runtime.Get();
	ASSERT_NE(first, nullptr);
	EXPECT_EQ(runtime.Get(), first);
	EXPECT_EQ(attempts, 1);
	EXPECT_NE(GetMonitorRuntime(), nullptr);
}

} // anonymous namespace
} // namespace jsbox

#pragma once
#include "execution_monitor.h"
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <ctime>

namespace jsbox {

/**
 * Fires once the calling thread has consumed a fixed amount of CPU time. Time spent blocked or
 * sleeping does not count.
 */
class CpuTimeMonitor final : public ExecutionMonitor {
	public:
		// Throws `ConfigurationError` on a zero timeout
		explicit CpuTimeMonitor(std::chrono::nanoseconds cpu_timeout);

		// Throws `MonitorError` if the calling thread's CPU clock can't be read
		auto GetMonitor() const -> std::unique_ptr<MonitorFuture> final;
		auto Name() const -> const char* final { return "cpu-time"; }
		auto Timeout() const { return cpu_timeout; }

	private:
		std::chrono::nanoseconds cpu_timeout;
};

namespace detail {

/**
 * CPU clock of one thread, readable from any other thread while that thread is alive.
 */
class ThreadCpuClock {
	public:
		static auto ForCurrentThread() -> std::optional<ThreadCpuClock>;
		// Nanoseconds of CPU time consumed by the thread
		auto Elapsed() const -> std::optional<uint64_t>;

	private:
		explicit ThreadCpuClock(clockid_t clock_id) : clock_id{clock_id} {}
		clockid_t clock_id;
};

/**
 * Polls a CPU clock until `deadline`. A failed read counts as exceeded.
 */
class CpuTimeFuture final : public MonitorFuture {
	public:
		using reader_t = std::function<std::optional<uint64_t>()>;
		static constexpr auto kMinPollInterval = std::chrono::milliseconds{1};
		static constexpr auto kMaxPollInterval = std::chrono::milliseconds{10};

		CpuTimeFuture(reader_t read, uint64_t start, uint64_t deadline, std::chrono::nanoseconds timeout);

		auto Poll(clock_t::time_point now) -> std::optional<clock_t::time_point> final;

	private:
		reader_t read;
		uint64_t start;
		uint64_t deadline;
		std::chrono::nanoseconds timeout;
};

} // namespace detail
} // namespace jsbox

#pragma once
#include <chrono>
#include <memory>
#include <optional>

namespace jsbox {

/**
 * The pending half of a monitor. It is polled on the monitor runtime and completes exactly once,
 * when its budget is exceeded.
 */
class MonitorFuture {
	public:
		using clock_t = std::chrono::steady_clock;

		MonitorFuture() = default;
		MonitorFuture(const MonitorFuture&) = delete;
		virtual ~MonitorFuture() = default;
		auto operator=(const MonitorFuture&) = delete;

		// Returns `std::nullopt` once the budget is exceeded, otherwise when to poll next.
		virtual auto Poll(clock_t::time_point now) -> std::optional<clock_t::time_point> = 0;
};

/**
 * Policy which decides when guest execution must be terminated.
 *
 * `GetMonitor()` runs synchronously on the thread which is about to call into the guest, so it may
 * capture thread-affine state such as that thread's CPU clock. If it throws, the handler is not
 * run.
 */
class ExecutionMonitor {
	public:
		ExecutionMonitor() = default;
		ExecutionMonitor(const ExecutionMonitor&) = default;
		virtual ~ExecutionMonitor() = default;
		auto operator=(const ExecutionMonitor&) -> ExecutionMonitor& = default;

		virtual auto GetMonitor() const -> std::unique_ptr<MonitorFuture> = 0;
		// Used in logs and metrics
		virtual auto Name() const -> const char* = 0;
};

} // namespace jsbox

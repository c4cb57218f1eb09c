#include "cpu_time.h"
#include "sandbox/error.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <pthread.h>

namespace jsbox {

CpuTimeMonitor::CpuTimeMonitor(std::chrono::nanoseconds cpu_timeout) : cpu_timeout{cpu_timeout} {
	if (cpu_timeout <= std::chrono::nanoseconds::zero()) {
		throw ConfigurationError("cpu_timeout must be non-zero");
	}
}

auto CpuTimeMonitor::GetMonitor() const -> std::unique_ptr<MonitorFuture> {
	auto clock = detail::ThreadCpuClock::ForCurrentThread();
	if (!clock) {
		throw MonitorError("Failed to get CPU time handle for current thread");
	}
	auto start = clock->Elapsed();
	if (!start) {
		throw MonitorError("Failed to read initial CPU time");
	}
	auto budget = static_cast<uint64_t>(cpu_timeout.count());
	auto deadline = *start > UINT64_MAX - budget ? UINT64_MAX : *start + budget;
	return std::make_unique<detail::CpuTimeFuture>(
		[clock = *clock]() { return clock.Elapsed(); },
		*start, deadline, cpu_timeout
	);
}

namespace detail {

/**
 * ThreadCpuClock implementation
 */
auto ThreadCpuClock::ForCurrentThread() -> std::optional<ThreadCpuClock> {
	clockid_t clock_id;
	if (pthread_getcpuclockid(pthread_self(), &clock_id) != 0) {
		return std::nullopt;
	}
	return ThreadCpuClock{clock_id};
}

auto ThreadCpuClock::Elapsed() const -> std::optional<uint64_t> {
	timespec ts{};
	if (clock_gettime(clock_id, &ts) != 0) {
		return std::nullopt;
	}
	return static_cast<uint64_t>(ts.tv_sec) * 1000000000 + static_cast<uint64_t>(ts.tv_nsec);
}

/**
 * CpuTimeFuture implementation
 */
CpuTimeFuture::CpuTimeFuture(reader_t read, uint64_t start, uint64_t deadline, std::chrono::nanoseconds timeout) :
	read{std::move(read)}, start{start}, deadline{deadline}, timeout{timeout} {}

auto CpuTimeFuture::Poll(clock_t::time_point now) -> std::optional<clock_t::time_point> {
	auto current = read();
	if (!current) {
		spdlog::error("Failed to read CPU time, terminating execution");
		return std::nullopt;
	}
	if (*current >= deadline) {
		using std::chrono::duration_cast;
		using std::chrono::milliseconds;
		spdlog::warn(
			"CPU time limit exceeded (cpu_elapsed_ms={}, cpu_timeout_ms={})",
			(*current - std::min(start, *current)) / 1000000,
			duration_cast<milliseconds>(timeout).count()
		);
		return std::nullopt;
	}
	// Poll faster as the deadline approaches
	auto remaining = std::chrono::nanoseconds{static_cast<int64_t>(deadline - *current)};
	auto interval = std::clamp<clock_t::duration>(
		remaining / 2,
		std::chrono::duration_cast<clock_t::duration>(kMinPollInterval),
		std::chrono::duration_cast<clock_t::duration>(kMaxPollInterval)
	);
	return now + interval;
}

} // namespace detail
} // namespace jsbox

#pragma once
#include "lib/poll_runtime.h"
#include <functional>
#include <memory>
#include <mutex>

namespace jsbox {

constexpr const char* kMonitorThreadsEnv = "JSBOX_MONITOR_THREADS";
constexpr size_t kDefaultMonitorThreads = 2;

/**
 * Creates its runtime on first use, exactly once. A failed creation is remembered and never retried
 * so that a process under resource pressure doesn't keep trying to start threads.
 */
class LazyMonitorRuntime {
	public:
		using factory_t = std::function<std::unique_ptr<poll_runtime_t>()>;

		explicit LazyMonitorRuntime(factory_t factory) : factory{std::move(factory)} {}
		LazyMonitorRuntime(const LazyMonitorRuntime&) = delete;
		auto operator=(const LazyMonitorRuntime&) = delete;

		// Returns nullptr if the runtime could not be created
		auto Get() -> poll_runtime_t*;

	private:
		factory_t factory;
		std::once_flag once;
		std::unique_ptr<poll_runtime_t> runtime;
};

// Worker count from `JSBOX_MONITOR_THREADS`, or the default when unset or not a positive integer
auto MonitorThreadCount(const char* env_value) -> size_t;

// The process-wide runtime which hosts execution monitors
auto GetMonitorRuntime() -> poll_runtime_t*;

} // namespace jsbox

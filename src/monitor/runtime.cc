#include "runtime.h"
#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstdlib>
#include <exception>
#include <string>

namespace jsbox {

auto LazyMonitorRuntime::Get() -> poll_runtime_t* {
	std::call_once(once, [this]() {
		try {
			runtime = factory();
		} catch (const std::exception& error) {
			spdlog::error("Failed to create execution monitor runtime: {}. Monitors will be unavailable.", error.what());
		}
	});
	return runtime.get();
}

auto MonitorThreadCount(const char* env_value) -> size_t {
	if (env_value == nullptr || *env_value == '\0') {
		return kDefaultMonitorThreads;
	}
	char* end = nullptr;
	errno = 0;
	unsigned long long value = std::strtoull(env_value, &end, 10);
	if (errno != 0 || *end != '\0' || value == 0 || *env_value == '-') {
		return kDefaultMonitorThreads;
	}
	return static_cast<size_t>(value);
}

auto GetMonitorRuntime() -> poll_runtime_t* {
	// Leaked so that monitors still running during static destruction don't race the teardown
	static auto* runtime = new LazyMonitorRuntime{[]() {
		size_t workers = MonitorThreadCount(std::getenv(kMonitorThreadsEnv));
		auto runtime = std::make_unique<poll_runtime_t>(workers, "jsbox-monitor");
		spdlog::debug("Initialized monitor runtime (workers={})", workers);
		return runtime;
	}};
	return runtime->Get();
}

} // namespace jsbox

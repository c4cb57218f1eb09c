#pragma once
#include "execution_monitor.h"
#include <chrono>

namespace jsbox {

/**
 * Fires once a fixed amount of real time has passed since the monitored call started.
 */
class WallClockMonitor final : public ExecutionMonitor {
	public:
		// Throws `ConfigurationError` on a zero timeout
		explicit WallClockMonitor(std::chrono::nanoseconds timeout);

		auto GetMonitor() const -> std::unique_ptr<MonitorFuture> final;
		auto Name() const -> const char* final { return "wall-clock"; }
		auto Timeout() const { return timeout; }

	private:
		std::chrono::nanoseconds timeout;
};

} // namespace jsbox

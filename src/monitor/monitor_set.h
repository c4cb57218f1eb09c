#pragma once
#include "execution_monitor.h"
#include "lib/poll_runtime.h"
#include <array>
#include <cstddef>
#include <memory>
#include <type_traits>
#include <vector>

namespace jsbox {

class InterruptHandle;
class LoadedSandbox;

/**
 * One to five monitors raced against each other, first to fire wins. This is a closed set: it can be
 * built from monitors but not extended, and only the sandbox can start the race.
 *
 * The set refers to its monitors, which must outlive any call the set is passed to.
 */
class MonitorSet final {
	friend LoadedSandbox;

	public:
		static constexpr size_t kMaxMonitors = 5;

		MonitorSet(const ExecutionMonitor& monitor) : monitors{{&monitor}}, count{1} {} // NOLINT(hicpp-explicit-conversions)

		template <class... Monitors, std::enable_if_t<(sizeof...(Monitors) > 1), int> = 0>
		explicit MonitorSet(const Monitors&... monitors) : monitors{{&monitors...}}, count{sizeof...(Monitors)} {
			static_assert(sizeof...(Monitors) <= kMaxMonitors, "At most 5 monitors may be raced");
			static_assert(std::conjunction_v<std::is_base_of<ExecutionMonitor, Monitors>...>, "Every member must be an ExecutionMonitor");
		}

		auto Size() const { return count; }
		auto Names() const -> std::vector<const char*>;

	private:
		// Runs `GetMonitor()` of every member, in order, on the calling thread. If any of them throws
		// nothing is returned. The returned task completes when the first future completes, and kills
		// `interrupt` as it does.
		auto ToRace(std::shared_ptr<InterruptHandle> interrupt) const -> std::unique_ptr<poll_runtime_t::task_t>;

		std::array<const ExecutionMonitor*, kMaxMonitors> monitors{};
		size_t count;
};

// Logs and counts a fired monitor
void RecordMonitorTriggered(const char* name);

} // namespace jsbox

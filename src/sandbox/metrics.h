#pragma once
#include <cstdint>
#include <map>
#include <string>

namespace jsbox {
namespace metrics {

enum class Stage { Proto, Unloaded, Loaded };

struct StageCounts {
	int64_t active = 0;
	uint64_t total = 0;
};

struct Values {
	StageCounts proto;
	StageCounts unloaded;
	StageCounts loaded;
	uint64_t sandbox_loads_total = 0;
	uint64_t sandbox_unloads_total = 0;
	// Keyed by monitor name
	std::map<std::string, uint64_t> monitor_terminations_total;
};

auto Get() -> Values;

void RecordSandboxLoad();
void RecordSandboxUnload();
void RecordMonitorTermination(const char* monitor_type);

/**
 * Counts one live stage object. Moving the guard moves the count with it, so a moved-from stage
 * object is never counted twice.
 */
template <Stage Which>
class StageGuard {
	public:
		StageGuard() { Enter(Which); }
		StageGuard(const StageGuard&) = delete;
		StageGuard(StageGuard&& that) noexcept : active{that.active} { that.active = false; }
		~StageGuard() {
			if (active) {
				Leave(Which);
			}
		}
		auto operator=(const StageGuard&) = delete;
		auto operator=(StageGuard&& that) noexcept -> StageGuard& {
			if (active) {
				Leave(Which);
			}
			active = that.active;
			that.active = false;
			return *this;
		}

	private:
		static void Enter(Stage stage);
		static void Leave(Stage stage);
		bool active = true;
};

} // namespace metrics
} // namespace jsbox

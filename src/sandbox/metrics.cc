#include "metrics.h"
#include "lib/lockable.h"

namespace jsbox {
namespace metrics {
namespace {

lockable_t<Values> values;

auto CountsFor(Values& values, Stage stage) -> StageCounts& {
	switch (stage) {
		case Stage::Proto: return values.proto;
		case Stage::Unloaded: return values.unloaded;
		case Stage::Loaded: break;
	}
	return values.loaded;
}

} // anonymous namespace

auto Get() -> Values {
	return *values.read();
}

void RecordSandboxLoad() {
	++values.write()->sandbox_loads_total;
}

void RecordSandboxUnload() {
	++values.write()->sandbox_unloads_total;
}

void RecordMonitorTermination(const char* monitor_type) {
	++values.write()->monitor_terminations_total[monitor_type];
}

template <Stage Which>
void StageGuard<Which>::Enter(Stage stage) {
	auto lock = values.write();
	auto& counts = CountsFor(*lock, stage);
	++counts.active;
	++counts.total;
}

template <Stage Which>
void StageGuard<Which>::Leave(Stage stage) {
	auto lock = values.write();
	--CountsFor(*lock, stage).active;
}

template class StageGuard<Stage::Proto>;
template class StageGuard<Stage::Unloaded>;
template class StageGuard<Stage::Loaded>;

} // namespace metrics
} // namespace jsbox

#include "monitor_set.h"
#include "sandbox/error.h"
#include "sandbox/guest.h"
#include "sandbox/metrics.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <string>
#include <utility>

namespace jsbox {
namespace {

struct Contender {
	std::unique_ptr<MonitorFuture> future;
	const char* name;
};

class RaceTask final : public poll_runtime_t::task_t {
	public:
		RaceTask(std::vector<Contender> contenders, std::shared_ptr<InterruptHandle> interrupt) :
			contenders{std::move(contenders)}, interrupt{std::move(interrupt)} {}

		auto poll(poll_runtime_t::clock_t::time_point now) -> std::optional<poll_runtime_t::clock_t::time_point> final {
			std::optional<poll_runtime_t::clock_t::time_point> next;
			for (auto& contender : contenders) {
				auto wake = contender.future->Poll(now);
				if (!wake) {
					RecordMonitorTriggered(contender.name);
					interrupt->Kill();
					return std::nullopt;
				}
				next = next ? std::min(*next, *wake) : *wake;
			}
			return next;
		}

	private:
		std::vector<Contender> contenders;
		std::shared_ptr<InterruptHandle> interrupt;
};

} // anonymous namespace

void RecordMonitorTriggered(const char* name) {
	metrics::RecordMonitorTermination(name);
	spdlog::warn("Monitor '{}' fired, requesting execution termination", name);
}

auto MonitorSet::Names() const -> std::vector<const char*> {
	std::vector<const char*> names;
	for (size_t ii = 0; ii < count; ++ii) {
		names.push_back(monitors[ii]->Name());
	}
	return names;
}

auto MonitorSet::ToRace(std::shared_ptr<InterruptHandle> interrupt) const -> std::unique_ptr<poll_runtime_t::task_t> {
	std::vector<Contender> contenders;
	contenders.reserve(count);
	for (size_t ii = 0; ii < count; ++ii) {
		auto future = monitors[ii]->GetMonitor();
		if (!future) {
			throw MonitorError(std::string{"Monitor '"} + monitors[ii]->Name() + "' produced no future");
		}
		contenders.push_back(Contender{std::move(future), monitors[ii]->Name()});
	}
	return std::make_unique<RaceTask>(std::move(contenders), std::move(interrupt));
}

} // namespace jsbox

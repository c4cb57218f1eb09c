#include "wall_clock.h"
#include "sandbox/error.h"
#include <spdlog/spdlog.h>

namespace jsbox {
namespace {

class WallClockFuture final : public MonitorFuture {
	public:
		explicit WallClockFuture(clock_t::time_point deadline) : deadline{deadline} {}

		auto Poll(clock_t::time_point now) -> std::optional<clock_t::time_point> final {
			if (now < deadline) {
				return deadline;
			}
			spdlog::warn("Wall-clock timeout exceeded");
			return std::nullopt;
		}

	private:
		clock_t::time_point deadline;
};

} // anonymous namespace

WallClockMonitor::WallClockMonitor(std::chrono::nanoseconds timeout) : timeout{timeout} {
	if (timeout <= std::chrono::nanoseconds::zero()) {
		throw ConfigurationError("timeout must be non-zero");
	}
}

auto WallClockMonitor::GetMonitor() const -> std::unique_ptr<MonitorFuture> {
	auto deadline = MonitorFuture::clock_t::now() + std::chrono::duration_cast<MonitorFuture::clock_t::duration>(timeout);
	return std::make_unique<WallClockFuture>(deadline);
}

} // namespace jsbox

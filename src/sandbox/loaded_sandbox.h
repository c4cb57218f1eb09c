#pragma once
#include "guest.h"
#include "metrics.h"
#include "monitor/monitor_set.h"
#include <memory>
#include <optional>
#include <string>

namespace jsbox {

class Sandbox;

/**
 * A guest with handlers compiled in, ready to run events. Calls into one instance must be serialized
 * by the caller.
 */
class LoadedSandbox {
	friend Sandbox;

	public:
		LoadedSandbox(LoadedSandbox&&) = default;
		~LoadedSandbox() = default;
		auto operator=(LoadedSandbox&&) -> LoadedSandbox& = default;

		// Runs handler `name` with `event`, which must be JSON text, and returns the handler's result as
		// JSON text. A full garbage collection follows the call unless `gc` is false.
		auto HandleEvent(const std::string& name, const std::string& event, std::optional<bool> gc = std::nullopt) -> std::string;

		// As `HandleEvent()`, but the call is killed as soon as any monitor in `monitors` fires. If a
		// monitor can't be started the handler is not run.
		auto HandleEventWithMonitor(
			const std::string& name,
			const std::string& event,
			const MonitorSet& monitors,
			std::optional<bool> gc = std::nullopt
		) -> std::string;

		// A failed snapshot poisons the sandbox
		auto Snapshot() -> std::shared_ptr<const GuestSnapshot>;
		// Only snapshots taken from this sandbox may be restored. Clears the poisoned flag.
		void Restore(const std::shared_ptr<const GuestSnapshot>& snapshot);
		auto GetInterruptHandle() const -> std::shared_ptr<InterruptHandle>;
		auto Poisoned() const -> bool;

		// Returns the guest to its state right after the runtime loaded, with no handlers
		auto Unload() && -> Sandbox;

	private:
		LoadedSandbox(std::unique_ptr<Guest> guest, std::shared_ptr<const GuestSnapshot> runtime_snapshot);
		auto GetGuest() const -> Guest&;

		std::unique_ptr<Guest> guest;
		std::shared_ptr<const GuestSnapshot> runtime_snapshot;
		std::shared_ptr<InterruptHandle> interrupt;
		bool snapshot_failed = false;
		metrics::StageGuard<metrics::Stage::Loaded> stage_guard;
};

} // namespace jsbox

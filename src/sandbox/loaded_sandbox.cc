#include "loaded_sandbox.h"
#include "error.h"
#include "sandbox.h"
#include "monitor/runtime.h"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <utility>

namespace jsbox {

LoadedSandbox::LoadedSandbox(std::unique_ptr<Guest> guest, std::shared_ptr<const GuestSnapshot> runtime_snapshot) :
		guest{std::move(guest)}, runtime_snapshot{std::move(runtime_snapshot)} {
	interrupt = this->guest->GetInterruptHandle();
	metrics::RecordSandboxLoad();
}

auto LoadedSandbox::GetGuest() const -> Guest& {
	if (!guest) {
		throw ConsumedError("Sandbox has already been unloaded");
	}
	return *guest;
}

auto LoadedSandbox::HandleEvent(const std::string& name, const std::string& event, std::optional<bool> gc) -> std::string {
	if (!nlohmann::json::accept(event)) {
		throw InputError("Event is not valid JSON");
	}
	if (name.empty()) {
		throw InputError("Handler name must not be empty");
	}
	auto& guest = GetGuest();
	if (Poisoned()) {
		throw PoisonedError("Sandbox is poisoned and must be restored or unloaded");
	}
	auto result = guest.Call("HandleEvent", {name, event, gc.value_or(true)});
	if (auto* json = std::get_if<std::string>(&result)) {
		return std::move(*json);
	}
	throw GuestError("Handler '" + name + "' did not produce a JSON result");
}

auto LoadedSandbox::HandleEventWithMonitor(
	const std::string& name,
	const std::string& event,
	const MonitorSet& monitors,
	std::optional<bool> gc
) -> std::string {
	if (name.empty()) {
		throw InputError("Handler name must not be empty");
	}
	auto interrupt = GetInterruptHandle();

	std::unique_ptr<poll_runtime_t::task_t> race;
	try {
		race = monitors.ToRace(interrupt);
	} catch (const std::exception& error) {
		spdlog::error("Failed to initialize execution monitor: {}", error.what());
		throw MonitorError(std::string{"Execution monitor failed to start: "} + error.what());
	}
	auto* runtime = GetMonitorRuntime();
	if (runtime == nullptr) {
		spdlog::error("Monitor runtime is unavailable");
		throw MonitorError("Monitor runtime is unavailable");
	}

	// Aborts the race on every way out of this function
	auto race_guard = runtime->spawn(std::move(race));
	return HandleEvent(name, event, gc);
}

auto LoadedSandbox::Snapshot() -> std::shared_ptr<const GuestSnapshot> {
	auto& guest = GetGuest();
	if (Poisoned()) {
		throw PoisonedError("Cannot snapshot a poisoned sandbox");
	}
	try {
		return guest.Snapshot();
	} catch (const SandboxError& error) {
		// The guest may have been torn down partway through serializing
		spdlog::error("Guest snapshot failed: {}", error.what());
		snapshot_failed = true;
		throw;
	}
}

void LoadedSandbox::Restore(const std::shared_ptr<const GuestSnapshot>& snapshot) {
	if (!snapshot) {
		throw InputError("Snapshot must not be null");
	}
	GetGuest().Restore(*snapshot);
	snapshot_failed = false;
}

auto LoadedSandbox::GetInterruptHandle() const -> std::shared_ptr<InterruptHandle> {
	GetGuest();
	return interrupt;
}

auto LoadedSandbox::Poisoned() const -> bool {
	return snapshot_failed || GetGuest().Poisoned();
}

auto LoadedSandbox::Unload() && -> Sandbox {
	auto& guest = GetGuest();
	guest.Restore(*runtime_snapshot);
	metrics::RecordSandboxUnload();
	interrupt.reset();
	return Sandbox{std::exchange(this->guest, nullptr), std::move(runtime_snapshot)};
}

} // namespace jsbox

#include "sandbox.h"
#include "error.h"
#include "loaded_sandbox.h"
#include <utility>

namespace jsbox {

Sandbox::Sandbox(std::unique_ptr<Guest> guest) : guest{std::move(guest)} {
	runtime_snapshot = this->guest->Snapshot();
}

Sandbox::Sandbox(std::unique_ptr<Guest> guest, std::shared_ptr<const GuestSnapshot> runtime_snapshot) :
	guest{std::move(guest)}, runtime_snapshot{std::move(runtime_snapshot)} {}

auto Sandbox::GetGuest() const -> Guest& {
	if (!guest) {
		throw ConsumedError("Sandbox has already been loaded");
	}
	return *guest;
}

void Sandbox::AddHandler(const std::string& name, Script script) {
	GetGuest();
	if (name.empty()) {
		throw RegistryError("Handler name must not be empty");
	}
	if (handlers.find(name) != handlers.end()) {
		throw RegistryError("Handler already exists for function name: " + name);
	}
	handlers.emplace(name, std::move(script));
}

void Sandbox::RemoveHandler(const std::string& name) {
	GetGuest();
	if (name.empty()) {
		throw RegistryError("Handler name must not be empty");
	}
	if (handlers.erase(name) == 0) {
		throw RegistryError("Handler does not exist for function name: " + name);
	}
}

void Sandbox::ClearHandlers() {
	handlers.clear();
}

auto Sandbox::HandlerNames() const -> std::vector<std::string> {
	std::vector<std::string> names;
	names.reserve(handlers.size());
	for (const auto& entry : handlers) {
		names.push_back(entry.first);
	}
	return names;
}

auto Sandbox::Poisoned() const -> bool {
	return GetGuest().Poisoned();
}

auto Sandbox::GetLoadedSandbox() && -> LoadedSandbox {
	if (handlers.empty()) {
		GetGuest();
		throw RegistryError("No handlers have been added to the sandbox");
	}
	if (GetGuest().Poisoned()) {
		throw PoisonedError("Sandbox is poisoned and must be restored before handlers can be loaded");
	}
	// From here on the guest belongs to this call; a failure drops it
	auto loading = std::exchange(guest, nullptr);
	auto registry = std::exchange(handlers, {});
	for (const auto& entry : registry) {
		const auto& base = entry.second.BasePath();
		loading->Call("RegisterHandler", {
			entry.first,
			entry.second.Content(),
			base ? GuestValue{*base} : GuestValue{std::monostate{}},
		});
	}
	return LoadedSandbox{std::move(loading), std::move(runtime_snapshot)};
}

} // namespace jsbox

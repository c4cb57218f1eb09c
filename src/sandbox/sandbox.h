#pragma once
#include "guest.h"
#include "metrics.h"
#include "script.h"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace jsbox {

class LoadedSandbox;
class ProtoSandbox;

/**
 * A guest with its runtime loaded and a registry of handlers which haven't been pushed into it yet.
 */
class Sandbox {
	friend LoadedSandbox;
	friend ProtoSandbox;

	public:
		Sandbox(Sandbox&&) = default;
		~Sandbox() = default;
		auto operator=(Sandbox&&) -> Sandbox& = default;

		void AddHandler(const std::string& name, Script script);
		void RemoveHandler(const std::string& name);
		void ClearHandlers();
		auto HandlerNames() const -> std::vector<std::string>;
		auto Poisoned() const -> bool;

		// Pushes every handler into the guest. Fails without consuming the sandbox when no handler was
		// added. If the guest rejects a handler the sandbox is consumed anyway and the guest is dropped.
		auto GetLoadedSandbox() && -> LoadedSandbox;

	private:
		// Takes the snapshot which `LoadedSandbox::Unload()` returns to
		explicit Sandbox(std::unique_ptr<Guest> guest);
		Sandbox(std::unique_ptr<Guest> guest, std::shared_ptr<const GuestSnapshot> runtime_snapshot);
		auto GetGuest() const -> Guest&;

		std::unique_ptr<Guest> guest;
		std::shared_ptr<const GuestSnapshot> runtime_snapshot;
		std::map<std::string, Script> handlers;
		metrics::StageGuard<metrics::Stage::Unloaded> stage_guard;
};

} // namespace jsbox

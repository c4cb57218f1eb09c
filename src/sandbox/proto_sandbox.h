#pragma once
#include "config.h"
#include "guest.h"
#include "host_module.h"
#include "metrics.h"
#include <memory>
#include <string>

namespace jsbox {

class Sandbox;
class SandboxBuilder;

/**
 * A freshly allocated guest with no runtime. Host modules and the module loader are collected here
 * because the runtime can only learn about them while it boots.
 */
class ProtoSandbox {
	friend SandboxBuilder;

	public:
		ProtoSandbox(ProtoSandbox&&) = default;
		~ProtoSandbox() = default;
		auto operator=(ProtoSandbox&&) -> ProtoSandbox& = default;

		// Returns the named module, creating it if needed
		auto HostModule(const std::string& name) -> jsbox::HostModule&;
		auto Register(const std::string& module, std::string name, HostJsFunction function) -> ProtoSandbox&;
		void SetModuleLoader(std::shared_ptr<ModuleLoader> loader);

		// Boots the scripting runtime. The returned sandbox holds a snapshot of the guest as it is right
		// after boot, which `LoadedSandbox::Unload()` returns to.
		auto LoadRuntime() && -> Sandbox;

	private:
		ProtoSandbox(std::unique_ptr<UninitializedGuest> guest, HostPrintFunction host_print);
		auto GetGuest() -> UninitializedGuest&;

		std::unique_ptr<UninitializedGuest> guest;
		HostModules host_modules;
		metrics::StageGuard<metrics::Stage::Proto> stage_guard;
};

} // namespace jsbox

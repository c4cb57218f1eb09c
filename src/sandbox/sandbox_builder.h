#pragma once
#include "config.h"
#include "guest.h"
#include <memory>

namespace jsbox {

class ProtoSandbox;

/**
 * Collects guest configuration. Invalid values are rejected by the setter which receives them.
 */
class SandboxBuilder {
	public:
		explicit SandboxBuilder(std::shared_ptr<GuestFactory> factory);

		auto WithGuestInputBufferSize(size_t size) -> SandboxBuilder&;
		auto WithGuestOutputBufferSize(size_t size) -> SandboxBuilder&;
		// Sizes at or below the minimum are ignored
		auto WithGuestStackSize(uint64_t size) -> SandboxBuilder&;
		auto WithGuestHeapSize(uint64_t size) -> SandboxBuilder&;
		auto WithHostPrintFn(HostPrintFunction print) -> SandboxBuilder&;

		auto GetConfig() const -> const SandboxConfiguration& { return config; }

		// Allocates the guest
		auto Build() && -> ProtoSandbox;

	private:
		std::shared_ptr<GuestFactory> factory;
		SandboxConfiguration config;
		HostPrintFunction host_print;
};

} // namespace jsbox

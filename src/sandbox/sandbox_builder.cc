#include "sandbox_builder.h"
#include "error.h"
#include "proto_sandbox.h"

namespace jsbox {

SandboxBuilder::SandboxBuilder(std::shared_ptr<GuestFactory> factory) : factory{std::move(factory)} {}

auto SandboxBuilder::WithGuestInputBufferSize(size_t size) -> SandboxBuilder& {
	if (size == 0) {
		throw ConfigurationError("Input buffer size must be greater than 0");
	}
	config.input_buffer_size = size;
	return *this;
}

auto SandboxBuilder::WithGuestOutputBufferSize(size_t size) -> SandboxBuilder& {
	if (size == 0) {
		throw ConfigurationError("Output buffer size must be greater than 0");
	}
	config.output_buffer_size = size;
	return *this;
}

auto SandboxBuilder::WithGuestStackSize(uint64_t size) -> SandboxBuilder& {
	if (size == 0) {
		throw ConfigurationError("Stack size must be greater than 0");
	}
	if (size > kMinStackSize) {
		config.stack_size = size;
	}
	return *this;
}

auto SandboxBuilder::WithGuestHeapSize(uint64_t size) -> SandboxBuilder& {
	if (size == 0) {
		throw ConfigurationError("Heap size must be greater than 0");
	}
	if (size > kMinHeapSize) {
		config.heap_size = size;
	}
	return *this;
}

auto SandboxBuilder::WithHostPrintFn(HostPrintFunction print) -> SandboxBuilder& {
	host_print = std::move(print);
	return *this;
}

auto SandboxBuilder::Build() && -> ProtoSandbox {
	if (!factory) {
		throw ConfigurationError("No guest engine is available");
	}
	auto guest = factory->Create(config);
	if (!guest) {
		throw InternalError("Guest factory returned no guest");
	}
	return ProtoSandbox{std::move(guest), std::move(host_print)};
}

} // namespace jsbox

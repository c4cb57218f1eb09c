#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace jsbox {

using HostPrintFunction = std::function<void(const std::string&)>;

constexpr uint64_t kMinStackSize = 256 * 1024;
constexpr uint64_t kMinHeapSize = 16 * 1024 * 1024;
constexpr size_t kDefaultInputBufferSize = 16 * 1024;
constexpr size_t kDefaultOutputBufferSize = 16 * 1024;

/**
 * Resources given to one guest. Filled in by `SandboxBuilder`, read by `GuestFactory`.
 */
struct SandboxConfiguration {
	size_t input_buffer_size = kDefaultInputBufferSize;
	size_t output_buffer_size = kDefaultOutputBufferSize;
	uint64_t stack_size = kMinStackSize;
	uint64_t heap_size = kMinHeapSize;
};

} // namespace jsbox

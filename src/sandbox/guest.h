#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace jsbox {

struct SandboxConfiguration;

/**
 * Values which cross the host/guest boundary on typed calls. Handler payloads are JSON text carried
 * in the string alternative.
 */
using GuestValue = std::variant<std::monostate, bool, int64_t, double, std::string>;
using HostFunction = std::function<GuestValue(const std::vector<GuestValue>&)>;

/**
 * Requests termination of whatever is running in one guest. Safe to call from any thread, any number
 * of times. A request made while nothing is running has no effect on later calls.
 */
class InterruptHandle {
	public:
		InterruptHandle() = default;
		InterruptHandle(const InterruptHandle&) = delete;
		virtual ~InterruptHandle() = default;
		auto operator=(const InterruptHandle&) = delete;

		virtual void Kill() = 0;
};

/**
 * Opaque, immutable capture of guest state. Only meaningful to the guest that produced it.
 */
class GuestSnapshot {
	public:
		GuestSnapshot() = default;
		GuestSnapshot(const GuestSnapshot&) = delete;
		virtual ~GuestSnapshot() = default;
		auto operator=(const GuestSnapshot&) = delete;

		virtual auto Size() const -> size_t = 0;
};

/**
 * A guest with its scripting runtime loaded. Owned by exactly one sandbox stage at a time.
 */
class Guest {
	public:
		Guest() = default;
		Guest(const Guest&) = delete;
		virtual ~Guest() = default;
		auto operator=(const Guest&) = delete;

		// Invokes a function exported by the guest runtime. Throws `CanceledError` and poisons the guest
		// if the call was interrupted, `GuestError` if the guest reported a failure.
		virtual auto Call(const std::string& name, const std::vector<GuestValue>& args) -> GuestValue = 0;
		virtual auto Snapshot() -> std::shared_ptr<const GuestSnapshot> = 0;
		// Clears the poisoned flag.
		virtual void Restore(const GuestSnapshot& snapshot) = 0;
		virtual auto GetInterruptHandle() -> std::shared_ptr<InterruptHandle> = 0;
		virtual auto Poisoned() const -> bool = 0;
};

/**
 * A guest which has been allocated but has no runtime yet. Host functions must be registered before
 * `Evolve()` since the runtime may call them while it boots.
 */
class UninitializedGuest {
	public:
		UninitializedGuest() = default;
		UninitializedGuest(const UninitializedGuest&) = delete;
		virtual ~UninitializedGuest() = default;
		auto operator=(const UninitializedGuest&) = delete;

		virtual void RegisterHostFunction(const std::string& name, HostFunction function) = 0;
		virtual auto Evolve() -> std::unique_ptr<Guest> = 0;
};

class GuestFactory {
	public:
		GuestFactory() = default;
		GuestFactory(const GuestFactory&) = delete;
		virtual ~GuestFactory() = default;
		auto operator=(const GuestFactory&) = delete;

		virtual auto Create(const SandboxConfiguration& config) -> std::unique_ptr<UninitializedGuest> = 0;
};

} // namespace jsbox

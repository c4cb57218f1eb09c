#pragma once
#include "guest_isolate.h"
#include "sandbox/guest.h"
#include <memory>
#include <string>

namespace jsbox {

class V8InterruptHandle final : public InterruptHandle {
	public:
		explicit V8InterruptHandle(std::shared_ptr<GuestEnvironment> environment) : environment{std::move(environment)} {}
		void Kill() final;

	private:
		std::shared_ptr<GuestEnvironment> environment;
};

/**
 * A v8 guest with the runtime booted. Snapshot and restore swap out the underlying isolate, so the
 * isolate pointer is never handed out.
 */
class V8Guest final : public Guest {
	public:
		V8Guest(std::shared_ptr<GuestEnvironment> environment, std::unique_ptr<GuestIsolate> incarnation);

		auto Call(const std::string& name, const std::vector<GuestValue>& args) -> GuestValue final;
		auto Snapshot() -> std::shared_ptr<const GuestSnapshot> final;
		void Restore(const GuestSnapshot& snapshot) final;
		auto GetInterruptHandle() -> std::shared_ptr<InterruptHandle> final { return interrupt; }
		auto Poisoned() const -> bool final { return poisoned; }

	private:
		auto GetIncarnation() -> GuestIsolate&;
		void Reincarnate(std::shared_ptr<const GuestBlob> blob);

		std::shared_ptr<GuestEnvironment> environment;
		std::unique_ptr<GuestIsolate> incarnation;
		std::shared_ptr<V8InterruptHandle> interrupt;
		bool poisoned = false;
};

class V8UninitializedGuest final : public UninitializedGuest {
	public:
		explicit V8UninitializedGuest(const SandboxConfiguration& config);

		void RegisterHostFunction(const std::string& name, HostFunction function) final;
		auto Evolve() -> std::unique_ptr<Guest> final;

	private:
		std::shared_ptr<GuestEnvironment> environment;
		std::unique_ptr<GuestIsolate> incarnation;
};

class V8GuestFactory final : public GuestFactory {
	public:
		auto Create(const SandboxConfiguration& config) -> std::unique_ptr<UninitializedGuest> final;
};

} // namespace jsbox

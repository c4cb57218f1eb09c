#pragma once
#include "sandbox/config.h"
#include "sandbox/guest.h"
#include <atomic>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace jsbox {
namespace test {

/**
 * State shared by every stage of one fake guest, so tests can look inside it.
 *
 * A handler's behavior is picked by a keyword in its source:
 * - `echo`: returns the event
 * - `count`: increments a counter kept in the guest heap and returns `{"count":n}`
 * - `spin`: sleeps in a loop until killed
 * - `burn`: spins the CPU until killed
 * - `throw`: fails with a guest error
 * - `print`: calls the host `Print` function with "hello"
 * - `host`: calls `math.add(1, 2)` through `CallHostJsFunction`
 * - `undefined`: returns nothing
 */
struct FakeGuestState {
	SandboxConfiguration config;
	std::map<std::string, HostFunction> host_functions;
	std::map<std::string, std::string> handlers;
	std::string host_modules_manifest;
	std::vector<std::string> calls;
	int counter = 0;
	bool poisoned = false;
	std::atomic<bool> running{false};
	std::atomic<bool> killed{false};
	// Snapshots fail without the guest noticing, as if the isolate was lost while serializing
	bool fail_snapshot = false;
	// Handler registrations fail for sources containing this
	std::string reject_source = "syntax error";
};

class FakeInterruptHandle final : public InterruptHandle {
	public:
		explicit FakeInterruptHandle(std::shared_ptr<FakeGuestState> state) : state{std::move(state)} {}
		void Kill() final;

	private:
		std::shared_ptr<FakeGuestState> state;
};

class FakeSnapshot final : public GuestSnapshot {
	public:
		FakeSnapshot(int counter, std::map<std::string, std::string> handlers) : counter{counter}, handlers{std::move(handlers)} {}
		auto Size() const -> size_t final { return sizeof(counter) + handlers.size(); }

		int counter;
		std::map<std::string, std::string> handlers;
};

class FakeGuest final : public Guest {
	public:
		explicit FakeGuest(std::shared_ptr<FakeGuestState> state);

		auto Call(const std::string& name, const std::vector<GuestValue>& args) -> GuestValue final;
		auto Snapshot() -> std::shared_ptr<const GuestSnapshot> final;
		void Restore(const GuestSnapshot& snapshot) final;
		auto GetInterruptHandle() -> std::shared_ptr<InterruptHandle> final { return interrupt; }
		auto Poisoned() const -> bool final { return state->poisoned; }

	private:
		auto HandleEvent(const std::string& name, const std::string& event) -> GuestValue;
		void WaitForKill(bool burn);

		std::shared_ptr<FakeGuestState> state;
		std::shared_ptr<FakeInterruptHandle> interrupt;
};

class FakeUninitializedGuest final : public UninitializedGuest {
	public:
		explicit FakeUninitializedGuest(std::shared_ptr<FakeGuestState> state) : state{std::move(state)} {}

		void RegisterHostFunction(const std::string& name, HostFunction function) final;
		auto Evolve() -> std::unique_ptr<Guest> final;

	private:
		std::shared_ptr<FakeGuestState> state;
};

/**
 * Hands out fake guests and remembers the state of the last one
 */
class FakeGuestFactory final : public GuestFactory {
	public:
		auto Create(const SandboxConfiguration& config) -> std::unique_ptr<UninitializedGuest> final;

		std::shared_ptr<FakeGuestState> last;
};

} // namespace test
} // namespace jsbox

#include "fake_guest.h"
#include "sandbox/error.h"
#include <chrono>
#include <thread>

namespace jsbox {
namespace test {
namespace {

// Fakes give up eventually so that a broken monitor fails a test instead of hanging it
constexpr auto kGiveUpAfter = std::chrono::seconds{10};

auto Contains(const std::string& haystack, const char* needle) -> bool {
	return haystack.find(needle) != std::string::npos;
}

} // anonymous namespace

void FakeInterruptHandle::Kill() {
	if (state->running) {
		state->killed = true;
	}
}

FakeGuest::FakeGuest(std::shared_ptr<FakeGuestState> state) :
	state{std::move(state)}, interrupt{std::make_shared<FakeInterruptHandle>(this->state)} {}

auto FakeGuest::Call(const std::string& name, const std::vector<GuestValue>& args) -> GuestValue {
	state->calls.push_back(name);
	if (state->poisoned) {
		throw PoisonedError("Guest is poisoned");
	}
	auto string_at = [&](size_t index) -> std::string {
		return index < args.size() && std::holds_alternative<std::string>(args[index]) ? std::get<std::string>(args[index]) : std::string{};
	};
	if (name == "RegisterHostModules") {
		state->host_modules_manifest = string_at(0);
		return std::monostate{};
	} else if (name == "RegisterHandler") {
		auto source = string_at(1);
		if (Contains(source, state->reject_source.c_str())) {
			throw GuestError("SyntaxError: Unexpected identifier");
		}
		state->handlers[string_at(0)] = source;
		return std::monostate{};
	} else if (name == "HandleEvent") {
		return HandleEvent(string_at(0), string_at(1));
	}
	throw InternalError("Guest runtime has no function named " + name);
}

auto FakeGuest::HandleEvent(const std::string& name, const std::string& event) -> GuestValue {
	if (event.size() > state->config.input_buffer_size) {
		throw InputError("Guest input exceeds the input buffer size");
	}
	auto handler = state->handlers.find(name);
	if (handler == state->handlers.end()) {
		throw GuestError("No handler registered for function " + name);
	}
	const auto& source = handler->second;
	if (Contains(source, "echo")) {
		return event;
	} else if (Contains(source, "count")) {
		return "{\"count\":" + std::to_string(++state->counter) + "}";
	} else if (Contains(source, "spin") || Contains(source, "burn")) {
		WaitForKill(Contains(source, "burn"));
		return std::string{"\"finished\""};
	} else if (Contains(source, "throw")) {
		throw GuestError("Error: boom");
	} else if (Contains(source, "print")) {
		state->host_functions.at("Print")({std::string{"hello"}});
		return std::string{"null"};
	} else if (Contains(source, "host")) {
		return state->host_functions.at("CallHostJsFunction")({std::string{"math"}, std::string{"add"}, std::string{"[1,2]"}});
	}
	throw GuestError("The handler function did not return a value");
}

void FakeGuest::WaitForKill(bool burn) {
	state->killed = false;
	state->running = true;
	auto give_up = std::chrono::steady_clock::now() + kGiveUpAfter;
	while (!state->killed && std::chrono::steady_clock::now() < give_up) {
		if (!burn) {
			std::this_thread::sleep_for(std::chrono::milliseconds{1});
		}
	}
	state->running = false;
	if (state->killed) {
		state->poisoned = true;
		throw CanceledError("Execution canceled by host");
	}
}

auto FakeGuest::Snapshot() -> std::shared_ptr<const GuestSnapshot> {
	if (state->poisoned) {
		throw PoisonedError("Cannot snapshot a poisoned guest");
	}
	if (state->fail_snapshot) {
		throw InternalError("Failure creating snapshot");
	}
	return std::make_shared<FakeSnapshot>(state->counter, state->handlers);
}

void FakeGuest::Restore(const GuestSnapshot& snapshot) {
	const auto* fake = dynamic_cast<const FakeSnapshot*>(&snapshot);
	if (fake == nullptr) {
		throw InputError("Snapshot was not taken from a fake guest");
	}
	state->counter = fake->counter;
	state->handlers = fake->handlers;
	state->poisoned = false;
}

void FakeUninitializedGuest::RegisterHostFunction(const std::string& name, HostFunction function) {
	state->host_functions[name] = std::move(function);
}

auto FakeUninitializedGuest::Evolve() -> std::unique_ptr<Guest> {
	return std::make_unique<FakeGuest>(state);
}

auto FakeGuestFactory::Create(const SandboxConfiguration& config) -> std::unique_ptr<UninitializedGuest> {
	last = std::make_shared<FakeGuestState>();
	last->config = config;
	return std::make_unique<FakeUninitializedGuest>(last);
}

} // namespace test
} // namespace jsbox

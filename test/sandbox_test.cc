#include "fake_guest.h"
#include "sandbox/error.h"
#include "sandbox/loaded_sandbox.h"
#include "sandbox/proto_sandbox.h"
#include "sandbox/sandbox.h"
#include "sandbox/sandbox_builder.h"
#include "monitor/wall_clock.h"
#include <gtest/gtest.h>
#include <algorithm>
#include <chrono>
#include <thread>

namespace jsbox {
namespace {

using namespace std::chrono_literals;

class SandboxTest : public ::testing::Test {
	protected:
		auto Proto() -> ProtoSandbox {
			return SandboxBuilder{factory}.Build();
		}

		auto Unloaded() -> Sandbox {
			return Proto().LoadRuntime();
		}

		auto Loaded(const std::string& name, const std::string& source) -> LoadedSandbox {
			auto sandbox = Unloaded();
			sandbox.AddHandler(name, Script::FromContent(source));
			return std::move(sandbox).GetLoadedSandbox();
		}

		auto State() -> test::FakeGuestState& { return *factory->last; }

		std::shared_ptr<test::FakeGuestFactory> factory = std::make_shared<test::FakeGuestFactory>();
};

template <class Functor>
auto KindOf(Functor fn) -> ErrorKind {
	try {
		fn();
	} catch (const SandboxError& error) {
		return error.Kind();
	}
	ADD_FAILURE() << "No error was thrown";
	return ErrorKind::Internal;
}

TEST_F(SandboxTest, LoadRuntimeRegistersHostFunctions) {
	auto sandbox = Unloaded();
	EXPECT_EQ(State().host_modules_manifest, "{}");
	for (const char* name : {"CurrentTimeMicros", "Print", "CallHostJsFunction"}) {
		EXPECT_EQ(State().host_functions.count(name), 1U) << name;
	}
	auto now = State().host_functions.at("CurrentTimeMicros")({});
	EXPECT_GT(std::get<int64_t>(now), 0);
	EXPECT_FALSE(sandbox.Poisoned());
}

TEST_F(SandboxTest, HandlerRegistry) {
	auto sandbox = Unloaded();
	sandbox.AddHandler("a", Script::FromContent("echo"));
	sandbox.AddHandler("b", Script::FromContent("echo"));
	EXPECT_EQ(KindOf([&]() { sandbox.AddHandler("a", Script::FromContent("echo")); }), ErrorKind::Registry);
	EXPECT_EQ(KindOf([&]() { sandbox.AddHandler("", Script::FromContent("echo")); }), ErrorKind::Registry);
	EXPECT_EQ(KindOf([&]() { sandbox.RemoveHandler("missing"); }), ErrorKind::Registry);
	sandbox.RemoveHandler("a");
	EXPECT_EQ(sandbox.HandlerNames(), std::vector<std::string>{"b"});
	sandbox.ClearHandlers();
	EXPECT_TRUE(sandbox.HandlerNames().empty());
}

TEST_F(SandboxTest, EmptyRegistryDoesNotConsumeSandbox) {
	auto sandbox = Unloaded();
	try {
		std::move(sandbox).GetLoadedSandbox();
		FAIL() << "Loaded a sandbox with no handlers";
	} catch (const RegistryError& error) {
		EXPECT_EQ(error.GetMessage(), "No handlers have been added to the sandbox");
	}
	sandbox.AddHandler("echo", Script::FromContent("echo"));
	auto loaded = std::move(sandbox).GetLoadedSandbox();
	EXPECT_EQ(loaded.HandleEvent("echo", R"({"a":1})"), R"({"a":1})");
}

TEST_F(SandboxTest, RejectedHandlerDropsGuest) {
	auto sandbox = Unloaded();
	sandbox.AddHandler("bad", Script::FromContent("syntax error"));
	EXPECT_EQ(KindOf([&]() { std::move(sandbox).GetLoadedSandbox(); }), ErrorKind::Guest);
	EXPECT_EQ(KindOf([&]() { sandbox.AddHandler("good", Script::FromContent("echo")); }), ErrorKind::Consumed);
}

TEST_F(SandboxTest, HandleEventValidatesInput) {
	auto loaded = Loaded("echo", "echo");
	EXPECT_EQ(KindOf([&]() { loaded.HandleEvent("echo", "{not json"); }), ErrorKind::Input);
	EXPECT_EQ(KindOf([&]() { loaded.HandleEvent("", "{}"); }), ErrorKind::Input);
	EXPECT_EQ(KindOf([&]() { loaded.HandleEvent("missing", "{}"); }), ErrorKind::Guest);
	EXPECT_EQ(KindOf([&]() { loaded.HandleEvent("echo", std::string(State().config.input_buffer_size, ' ') + "1"); }), ErrorKind::Input);
	EXPECT_FALSE(loaded.Poisoned());
}

TEST_F(SandboxTest, GuestErrorsDoNotPoison) {
	auto loaded = Loaded("fail", "throw");
	EXPECT_EQ(KindOf([&]() { loaded.HandleEvent("fail", "{}"); }), ErrorKind::Guest);
	EXPECT_FALSE(loaded.Poisoned());
}

TEST_F(SandboxTest, SnapshotAndRestore) {
	auto loaded = Loaded("counter", "count");
	EXPECT_EQ(loaded.HandleEvent("counter", "{}"), R"({"count":1})");
	EXPECT_EQ(loaded.HandleEvent("counter", "{}"), R"({"count":2})");
	auto snapshot = loaded.Snapshot();
	EXPECT_EQ(loaded.HandleEvent("counter", "{}"), R"({"count":3})");
	loaded.Restore(snapshot);
	EXPECT_EQ(loaded.HandleEvent("counter", "{}"), R"({"count":3})");
	// A snapshot can be restored more than once
	loaded.Restore(snapshot);
	EXPECT_EQ(loaded.HandleEvent("counter", "{}"), R"({"count":3})");
	EXPECT_EQ(KindOf([&]() { loaded.Restore(nullptr); }), ErrorKind::Input);
}

TEST_F(SandboxTest, FailedSnapshotPoisonsUntilRestored) {
	auto loaded = Loaded("counter", "count");
	EXPECT_EQ(loaded.HandleEvent("counter", "{}"), R"({"count":1})");
	auto good = loaded.Snapshot();
	State().fail_snapshot = true;
	EXPECT_EQ(KindOf([&]() { loaded.Snapshot(); }), ErrorKind::Internal);
	EXPECT_TRUE(loaded.Poisoned());
	EXPECT_EQ(KindOf([&]() { loaded.HandleEvent("counter", "{}"); }), ErrorKind::Poisoned);
	EXPECT_EQ(KindOf([&]() { loaded.Snapshot(); }), ErrorKind::Poisoned);
	EXPECT_EQ(State().counter, 1);

	State().fail_snapshot = false;
	loaded.Restore(good);
	EXPECT_FALSE(loaded.Poisoned());
	EXPECT_EQ(loaded.HandleEvent("counter", "{}"), R"({"count":2})");
}

TEST_F(SandboxTest, UnloadReturnsToFreshRuntime) {
	auto loaded = Loaded("counter", "count");
	loaded.HandleEvent("counter", "{}");
	loaded.HandleEvent("counter", "{}");
	auto sandbox = std::move(loaded).Unload();
	EXPECT_TRUE(sandbox.HandlerNames().empty());
	EXPECT_EQ(KindOf([&]() { loaded.HandleEvent("counter", "{}"); }), ErrorKind::Consumed);

	sandbox.AddHandler("counter", Script::FromContent("count"));
	auto reloaded = std::move(sandbox).GetLoadedSandbox();
	EXPECT_EQ(reloaded.HandleEvent("counter", "{}"), R"({"count":1})");
}

TEST_F(SandboxTest, CancellationPoisonsUntilRestored) {
	auto loaded = Loaded("spin", "spin");
	auto clean = loaded.Snapshot();

	WallClockMonitor wall_clock{50ms};
	EXPECT_EQ(KindOf([&]() { loaded.HandleEventWithMonitor("spin", "{}", wall_clock); }), ErrorKind::Canceled);
	EXPECT_TRUE(loaded.Poisoned());
	EXPECT_EQ(KindOf([&]() { loaded.HandleEvent("spin", "{}"); }), ErrorKind::Poisoned);
	EXPECT_EQ(KindOf([&]() { loaded.Snapshot(); }), ErrorKind::Poisoned);

	loaded.Restore(clean);
	EXPECT_FALSE(loaded.Poisoned());
}

TEST_F(SandboxTest, UnloadClearsPoison) {
	auto loaded = Loaded("spin", "spin");
	WallClockMonitor wall_clock{50ms};
	EXPECT_THROW(loaded.HandleEventWithMonitor("spin", "{}", wall_clock), CanceledError);
	auto sandbox = std::move(loaded).Unload();
	EXPECT_FALSE(sandbox.Poisoned());
}

TEST_F(SandboxTest, InterruptHandleKillsRunningCall) {
	auto loaded = Loaded("spin", "spin");
	auto interrupt = loaded.GetInterruptHandle();
	// Nothing is running yet, so this has no effect
	interrupt->Kill();
	std::thread killer{[&]() {
		while (!State().running) {
			std::this_thread::sleep_for(1ms);
		}
		interrupt->Kill();
	}};
	EXPECT_EQ(KindOf([&]() { loaded.HandleEvent("spin", "{}"); }), ErrorKind::Canceled);
	killer.join();
	EXPECT_TRUE(loaded.Poisoned());
}

TEST_F(SandboxTest, HostModules) {
	auto proto = Proto();
	proto.Register("math", "add", [](const nlohmann::json& args) -> nlohmann::json {
		return args.at(0).get<int>() + args.at(1).get<int>();
	});
	proto.HostModule("strings").Register("upper", [](const nlohmann::json& /*args*/) -> nlohmann::json { return "X"; });
	auto sandbox = std::move(proto).LoadRuntime();
	EXPECT_EQ(nlohmann::json::parse(State().host_modules_manifest), nlohmann::json::parse(R"({"math":["add"],"strings":["upper"]})"));

	sandbox.AddHandler("host", Script::FromContent("host"));
	auto loaded = std::move(sandbox).GetLoadedSandbox();
	EXPECT_EQ(loaded.HandleEvent("host", "{}"), "3");

	auto& call = State().host_functions.at("CallHostJsFunction");
	try {
		call({std::string{"nope"}, std::string{"add"}, std::string{"[]"}});
		FAIL();
	} catch (const GuestError& error) {
		EXPECT_EQ(error.GetMessage(), "Host module 'nope' not found");
	}
	try {
		call({std::string{"math"}, std::string{"sub"}, std::string{"[]"}});
		FAIL();
	} catch (const GuestError& error) {
		EXPECT_EQ(error.GetMessage(), "Host function 'sub' not found in module 'math'");
	}
}

TEST_F(SandboxTest, HostPrint) {
	std::string printed;
	SandboxBuilder builder{factory};
	builder.WithHostPrintFn([&](const std::string& message) { printed += message; });
	auto sandbox = std::move(builder).Build().LoadRuntime();
	sandbox.AddHandler("print", Script::FromContent("print"));
	auto loaded = std::move(sandbox).GetLoadedSandbox();
	EXPECT_EQ(loaded.HandleEvent("print", "{}"), "null");
	EXPECT_EQ(printed, "hello");
}

TEST_F(SandboxTest, ModuleLoader) {
	auto proto = Proto();
	EXPECT_EQ(KindOf([&]() { proto.SetModuleLoader(nullptr); }), ErrorKind::Configuration);
	proto.SetModuleLoader(std::make_shared<EmbeddedModuleLoader>(std::map<std::string, std::string>{
		{"lib/util.js", "module.exports = 1;"},
	}));
	auto& resolve = State().host_functions.at("ResolveModule");
	auto& load = State().host_functions.at("LoadModule");
	auto path = resolve({std::string{"lib/handlers"}, std::string{"../util"}});
	EXPECT_EQ(std::get<std::string>(path), "lib/util.js");
	EXPECT_EQ(std::get<std::string>(load({path})), "module.exports = 1;");
}

TEST_F(SandboxTest, ConsumedStages) {
	auto proto = Proto();
	auto sandbox = std::move(proto).LoadRuntime();
	EXPECT_EQ(KindOf([&]() { proto.HostModule("late"); }), ErrorKind::Consumed);
	EXPECT_EQ(KindOf([&]() { std::move(proto).LoadRuntime(); }), ErrorKind::Consumed);

	sandbox.AddHandler("echo", Script::FromContent("echo"));
	auto loaded = std::move(sandbox).GetLoadedSandbox();
	EXPECT_EQ(KindOf([&]() { sandbox.AddHandler("again", Script::FromContent("echo")); }), ErrorKind::Consumed);
	EXPECT_EQ(KindOf([&]() { sandbox.Poisoned(); }), ErrorKind::Consumed);
}

} // anonymous namespace
} // namespace jsbox

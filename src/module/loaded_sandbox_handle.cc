#include "loaded_sandbox_handle.h"
#include "interrupt_handle.h"
#include "sandbox_handle.h"
#include "snapshot_handle.h"
#include "isolate/generic/read_option.h"
#include "monitor/cpu_time.h"
#include "monitor/wall_clock.h"
#include "sandbox/sandbox.h"
#include <chrono>
#include <optional>

namespace jsbox {
namespace {

using holder_t = StageHandle<LoadedSandbox>::holder_t;
using poisoned_t = std::shared_ptr<std::atomic<bool>>;

constexpr auto kClassName = "LoadedJSSandbox";
constexpr uint64_t kMaxTimeoutMs = 3600000;

auto ReadTimeout(v8::MaybeLocal<v8::Object> options, const char* name) -> std::optional<std::chrono::milliseconds> {
	auto timeout = ReadOption<uint64_t>(options, name);
	if (!timeout) {
		return std::nullopt;
	}
	if (*timeout < 1 || *timeout > kMaxTimeoutMs) {
		throw InputError{
			std::string{name} + " must be between 1ms and " + std::to_string(kMaxTimeoutMs) + "ms, got " + std::to_string(*timeout)};
	}
	return std::chrono::milliseconds{*timeout};
}

/**
 * Base for runners which operate on the sandbox in place and refresh the poisoned flag afterwards
 */
class InPlaceRunner : public ThreePhaseTask {
	public:
		InPlaceRunner(std::shared_ptr<holder_t> holder, poisoned_t poisoned) :
			holder{std::move(holder)}, poisoned{std::move(poisoned)} {}

		void Phase2() final {
			// The handle may already be gone, in which case the stage is released here on the pool
			auto holder = std::move(this->holder);
			auto lock = holder->write();
			auto& sandbox = StageHandle<LoadedSandbox>::Acquire(lock, kClassName);
			try {
				Run(sandbox);
			} catch (const SandboxError&) {
				poisoned->store(sandbox.Poisoned());
				throw;
			}
			poisoned->store(sandbox.Poisoned());
		}

	protected:
		virtual void Run(LoadedSandbox& sandbox) = 0;

	private:
		std::shared_ptr<holder_t> holder;
		poisoned_t poisoned;
};

class CallHandlerRunner final : public InPlaceRunner {
	public:
		CallHandlerRunner(
			std::shared_ptr<holder_t> holder,
			poisoned_t poisoned,
			std::string name,
			std::string event,
			std::optional<std::chrono::milliseconds> wall_clock_timeout,
			std::optional<std::chrono::milliseconds> cpu_timeout,
			std::optional<bool> gc
		) :
			InPlaceRunner{std::move(holder), std::move(poisoned)},
			name{std::move(name)},
			event{std::move(event)},
			wall_clock_timeout{wall_clock_timeout},
			cpu_timeout{cpu_timeout},
			gc{gc} {}

		auto Phase3() -> v8::Local<v8::Value> final {
			auto* isolate = v8::Isolate::GetCurrent();
			auto context = isolate->GetCurrentContext();
			return Unmaybe(v8::JSON::Parse(context, v8_string(result)));
		}

	protected:
		void Run(LoadedSandbox& sandbox) final {
			if (wall_clock_timeout && cpu_timeout) {
				WallClockMonitor wall_clock{*wall_clock_timeout};
				CpuTimeMonitor cpu_time{*cpu_timeout};
				result = sandbox.HandleEventWithMonitor(name, event, MonitorSet{wall_clock, cpu_time}, gc);
			} else if (wall_clock_timeout) {
				WallClockMonitor wall_clock{*wall_clock_timeout};
				result = sandbox.HandleEventWithMonitor(name, event, wall_clock, gc);
			} else if (cpu_timeout) {
				CpuTimeMonitor cpu_time{*cpu_timeout};
				result = sandbox.HandleEventWithMonitor(name, event, cpu_time, gc);
			} else {
				result = sandbox.HandleEvent(name, event, gc);
			}
		}

	private:
		std::string name;
		std::string event;
		std::optional<std::chrono::milliseconds> wall_clock_timeout;
		std::optional<std::chrono::milliseconds> cpu_timeout;
		std::optional<bool> gc;
		std::string result;
};

class SnapshotRunner final : public InPlaceRunner {
	public:
		using InPlaceRunner::InPlaceRunner;

		auto Phase3() -> v8::Local<v8::Value> final {
			return ClassHandle::NewInstance<SnapshotHandle>(std::move(snapshot));
		}

	protected:
		void Run(LoadedSandbox& sandbox) final {
			snapshot = sandbox.Snapshot();
		}

	private:
		std::shared_ptr<const GuestSnapshot> snapshot;
};

class RestoreRunner final : public InPlaceRunner {
	public:
		RestoreRunner(std::shared_ptr<holder_t> holder, poisoned_t poisoned, std::shared_ptr<const GuestSnapshot> snapshot) :
			InPlaceRunner{std::move(holder), std::move(poisoned)}, snapshot{std::move(snapshot)} {}

	protected:
		void Run(LoadedSandbox& sandbox) final {
			sandbox.Restore(snapshot);
		}

	private:
		std::shared_ptr<const GuestSnapshot> snapshot;
};

class UnloadRunner final : public ThreePhaseTask {
	public:
		UnloadRunner(std::shared_ptr<holder_t> holder, poisoned_t poisoned) :
			holder{std::move(holder)}, poisoned{std::move(poisoned)} {}

		void Phase2() final {
			auto holder = std::move(this->holder);
			auto lock = holder->write();
			auto& loaded = StageHandle<LoadedSandbox>::Acquire(lock, kClassName);
			sandbox.emplace(std::move(loaded).Unload());
			lock->reset();
			poisoned->store(false);
		}

		auto Phase3() -> v8::Local<v8::Value> final {
			return ClassHandle::NewInstance<SandboxHandle>(std::move(*sandbox));
		}

	private:
		std::shared_ptr<holder_t> holder;
		poisoned_t poisoned;
		std::optional<Sandbox> sandbox;
};

} // anonymous namespace

LoadedSandboxHandle::LoadedSandboxHandle(LoadedSandbox sandbox) :
		StageHandle{std::move(sandbox), kClassName} {
	auto lock = GetHolder()->read();
	interrupt = (*lock)->GetInterruptHandle();
	poisoned->store((*lock)->Poisoned());
}

auto LoadedSandboxHandle::Definition() -> v8::Local<v8::FunctionTemplate> {
	return MakeClass(kClassName, nullptr, {
		Method("callHandler", MemberEntry<LoadedSandboxHandle, &LoadedSandboxHandle::CallHandler>, 2),
		Method("unload", MemberEntry<LoadedSandboxHandle, &LoadedSandboxHandle::Unload>),
		Method("snapshot", MemberEntry<LoadedSandboxHandle, &LoadedSandboxHandle::Snapshot>),
		Method("restore", MemberEntry<LoadedSandboxHandle, &LoadedSandboxHandle::Restore>, 1),
		Getter("interruptHandle", MemberEntry<LoadedSandboxHandle, &LoadedSandboxHandle::InterruptHandleGetter>),
		Getter("poisoned", MemberEntry<LoadedSandboxHandle, &LoadedSandboxHandle::PoisonedGetter>),
	});
}

auto LoadedSandboxHandle::CallHandler(const v8::FunctionCallbackInfo<v8::Value>& info) -> v8::Local<v8::Value> {
	auto name = ReadArgument<std::string>(info, 0, "handlerName");
	if (name.empty()) {
		throw InputError{"Handler name must not be empty"};
	}
	auto context = info.GetIsolate()->GetCurrentContext();
	v8::Local<v8::Value> event_value = info.Length() > 1 ? info[1] : v8::Undefined(info.GetIsolate()).As<v8::Value>();
	v8::Local<v8::String> event_json;
	if (!v8::JSON::Stringify(context, event_value).ToLocal(&event_json) || event_value->IsUndefined()) {
		throw InputError{"Event must be JSON-serializable"};
	}
	auto options = ReadOptions(info, 2);
	auto wall_clock_timeout = ReadTimeout(options, "wallClockTimeoutMs");
	auto cpu_timeout = ReadTimeout(options, "cpuTimeoutMs");
	auto gc = ReadOption<bool>(options, "gc");
	return ThreePhaseTask::Run<1, CallHandlerRunner>(
		GetHolder(), poisoned,
		std::move(name), to_string(info.GetIsolate(), event_json),
		wall_clock_timeout, cpu_timeout, gc);
}

auto LoadedSandboxHandle::Unload(const v8::FunctionCallbackInfo<v8::Value>& /*info*/) -> v8::Local<v8::Value> {
	return ThreePhaseTask::Run<1, UnloadRunner>(GetHolder(), poisoned);
}

auto LoadedSandboxHandle::Snapshot(const v8::FunctionCallbackInfo<v8::Value>& /*info*/) -> v8::Local<v8::Value> {
	return ThreePhaseTask::Run<1, SnapshotRunner>(GetHolder(), poisoned);
}

auto LoadedSandboxHandle::Restore(const v8::FunctionCallbackInfo<v8::Value>& info) -> v8::Local<v8::Value> {
	SnapshotHandle* snapshot = nullptr;
	if (info.Length() > 0 && info[0]->IsObject()) {
		snapshot = ClassHandle::Unwrap<SnapshotHandle>(info[0].As<v8::Object>());
	}
	if (snapshot == nullptr) {
		throw InputError{"`snapshot` must be a Snapshot"};
	}
	return ThreePhaseTask::Run<1, RestoreRunner>(GetHolder(), poisoned, snapshot->GetSnapshot());
}

auto LoadedSandboxHandle::InterruptHandleGetter(const v8::FunctionCallbackInfo<v8::Value>& /*info*/) -> v8::Local<v8::Value> {
	return ClassHandle::NewInstance<InterruptHandleHandle>(interrupt);
}

auto LoadedSandboxHandle::PoisonedGetter(const v8::FunctionCallbackInfo<v8::Value>& info) -> v8::Local<v8::Value> {
	return v8::Boolean::New(info.GetIsolate(), poisoned->load());
}

} // namespace jsbox

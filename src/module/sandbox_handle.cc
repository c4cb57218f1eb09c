#include "sandbox_handle.h"
#include "loaded_sandbox_handle.h"
#include "isolate/generic/read_option.h"
#include "sandbox/loaded_sandbox.h"
#include <optional>

namespace jsbox {
namespace {

constexpr auto kClassName = "JSSandbox";

class GetLoadedSandboxRunner final : public ThreePhaseTask {
	public:
		explicit GetLoadedSandboxRunner(std::shared_ptr<StageHandle<Sandbox>::holder_t> holder) : holder{std::move(holder)} {}

		void Phase2() final {
			// The handle may already be gone, in which case the stage is released here on the pool
			auto holder = std::move(this->holder);
			auto lock = holder->write();
			auto& sandbox = StageHandle<Sandbox>::Acquire(lock, kClassName);
			try {
				loaded.emplace(std::move(sandbox).GetLoadedSandbox());
			} catch (const SandboxError& error) {
				// Registry and poisoned errors are raised before the guest is taken
				if (error.Kind() != ErrorKind::Registry && error.Kind() != ErrorKind::Poisoned) {
					lock->reset();
				}
				throw;
			}
			lock->reset();
		}

		auto Phase3() -> v8::Local<v8::Value> final {
			return ClassHandle::NewInstance<LoadedSandboxHandle>(std::move(*loaded));
		}

	private:
		std::shared_ptr<StageHandle<Sandbox>::holder_t> holder;
		std::optional<LoadedSandbox> loaded;
};

} // anonymous namespace

SandboxHandle::SandboxHandle(Sandbox sandbox) :
	StageHandle{std::move(sandbox), kClassName} {}

auto SandboxHandle::Definition() -> v8::Local<v8::FunctionTemplate> {
	return MakeClass(kClassName, nullptr, {
		Method("addHandler", MemberEntry<SandboxHandle, &SandboxHandle::AddHandler>, 2),
		Method("removeHandler", MemberEntry<SandboxHandle, &SandboxHandle::RemoveHandler>, 1),
		Method("clearHandlers", MemberEntry<SandboxHandle, &SandboxHandle::ClearHandlers>),
		Method("getLoadedSandbox", MemberEntry<SandboxHandle, &SandboxHandle::GetLoadedSandbox>),
		Getter("poisoned", MemberEntry<SandboxHandle, &SandboxHandle::PoisonedGetter>),
	});
}

auto SandboxHandle::AddHandler(const v8::FunctionCallbackInfo<v8::Value>& info) -> v8::Local<v8::Value> {
	auto name = ReadArgument<std::string>(info, 0, "functionName");
	auto script = Script::FromContent(ReadArgument<std::string>(info, 1, "script"));
	if (info.Length() > 2 && !info[2]->IsNullOrUndefined()) {
		script = std::move(script).WithVirtualBase(ReadArgument<std::string>(info, 2, "basePath"));
	}
	auto lock = GetHolder()->write();
	Acquire(lock, kClassName).AddHandler(name, std::move(script));
	return v8::Undefined(info.GetIsolate());
}

auto SandboxHandle::RemoveHandler(const v8::FunctionCallbackInfo<v8::Value>& info) -> v8::Local<v8::Value> {
	auto name = ReadArgument<std::string>(info, 0, "functionName");
	auto lock = GetHolder()->write();
	Acquire(lock, kClassName).RemoveHandler(name);
	return v8::Undefined(info.GetIsolate());
}

auto SandboxHandle::ClearHandlers(const v8::FunctionCallbackInfo<v8::Value>& info) -> v8::Local<v8::Value> {
	auto lock = GetHolder()->write();
	Acquire(lock, kClassName).ClearHandlers();
	return v8::Undefined(info.GetIsolate());
}

auto SandboxHandle::GetLoadedSandbox(const v8::FunctionCallbackInfo<v8::Value>& /*info*/) -> v8::Local<v8::Value> {
	return ThreePhaseTask::Run<1, GetLoadedSandboxRunner>(GetHolder());
}

auto SandboxHandle::PoisonedGetter(const v8::FunctionCallbackInfo<v8::Value>& info) -> v8::Local<v8::Value> {
	auto lock = GetHolder()->read();
	if (!*lock) {
		throw ConsumedError{std::string{kClassName} + " has been consumed"};
	}
	return v8::Boolean::New(info.GetIsolate(), (*lock)->Poisoned());
}

} // namespace jsbox

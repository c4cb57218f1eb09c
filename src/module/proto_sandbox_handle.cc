#include "proto_sandbox_handle.h"
#include "sandbox_handle.h"
#include "sandbox/sandbox.h"
#include <optional>

namespace jsbox {
namespace {

constexpr auto kClassName = "ProtoJSSandbox";

class LoadRuntimeRunner final : public ThreePhaseTask {
	public:
		explicit LoadRuntimeRunner(std::shared_ptr<StageHandle<ProtoSandbox>::holder_t> holder) : holder{std::move(holder)} {}

		void Phase2() final {
			// The handle may already be gone, in which case the stage is released here on the pool
			auto holder = std::move(this->holder);
			std::optional<ProtoSandbox> proto;
			{
				auto lock = holder->write();
				StageHandle<ProtoSandbox>::Acquire(lock, kClassName);
				proto = std::move(*lock);
				lock->reset();
			}
			sandbox.emplace(std::move(*proto).LoadRuntime());
		}

		auto Phase3() -> v8::Local<v8::Value> final {
			return ClassHandle::NewInstance<SandboxHandle>(std::move(*sandbox));
		}

	private:
		std::shared_ptr<StageHandle<ProtoSandbox>::holder_t> holder;
		std::optional<Sandbox> sandbox;
};

} // anonymous namespace

ProtoSandboxHandle::ProtoSandboxHandle(ProtoSandbox sandbox) :
	StageHandle{std::move(sandbox), kClassName} {}

auto ProtoSandboxHandle::Definition() -> v8::Local<v8::FunctionTemplate> {
	return MakeClass(kClassName, nullptr, {
		Method("loadRuntime", MemberEntry<ProtoSandboxHandle, &ProtoSandboxHandle::LoadRuntime>),
	});
}

auto ProtoSandboxHandle::LoadRuntime(const v8::FunctionCallbackInfo<v8::Value>& /*info*/) -> v8::Local<v8::Value> {
	return ThreePhaseTask::Run<1, LoadRuntimeRunner>(GetHolder());
}

} // namespace jsbox

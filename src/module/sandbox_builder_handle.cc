#include "sandbox_builder_handle.h"
#include "proto_sandbox_handle.h"
#include "isolate/generic/read_option.h"
#include "isolate/v8_guest.h"
#include <optional>

namespace jsbox {
namespace {

constexpr auto kClassName = "SandboxBuilder";

class BuildRunner final : public ThreePhaseTask {
	public:
		explicit BuildRunner(SandboxBuilder builder) : builder{std::move(builder)} {}

		void Phase2() final {
			sandbox.emplace(std::move(*builder).Build());
			builder.reset();
		}

		auto Phase3() -> v8::Local<v8::Value> final {
			return ClassHandle::NewInstance<ProtoSandboxHandle>(std::move(*sandbox));
		}

	private:
		std::optional<SandboxBuilder> builder;
		std::optional<ProtoSandbox> sandbox;
};

} // anonymous namespace

SandboxBuilderHandle::SandboxBuilderHandle(SandboxBuilder builder) :
	StageHandle{std::move(builder), kClassName} {}

auto SandboxBuilderHandle::Definition() -> v8::Local<v8::FunctionTemplate> {
	return MakeClass(kClassName, ConstructorEntry<SandboxBuilderHandle>, {
		Method("setInputBufferSize", MemberEntry<SandboxBuilderHandle, &SandboxBuilderHandle::SetInputBufferSize>, 1),
		Method("setOutputBufferSize", MemberEntry<SandboxBuilderHandle, &SandboxBuilderHandle::SetOutputBufferSize>, 1),
		Method("setStackSize", MemberEntry<SandboxBuilderHandle, &SandboxBuilderHandle::SetStackSize>, 1),
		Method("setHeapSize", MemberEntry<SandboxBuilderHandle, &SandboxBuilderHandle::SetHeapSize>, 1),
		Method("build", MemberEntry<SandboxBuilderHandle, &SandboxBuilderHandle::Build>),
	});
}

auto SandboxBuilderHandle::New(const v8::FunctionCallbackInfo<v8::Value>& /*info*/) -> std::unique_ptr<SandboxBuilderHandle> {
	return std::make_unique<SandboxBuilderHandle>(SandboxBuilder{std::make_shared<V8GuestFactory>()});
}

template <class Setter>
auto SandboxBuilderHandle::Configure(const v8::FunctionCallbackInfo<v8::Value>& info, const char* name, Setter setter) -> v8::Local<v8::Value> {
	auto value = ReadArgument<uint64_t>(info, 0, name);
	auto lock = GetHolder()->write();
	setter(Acquire(lock, kClassName), value);
	return info.This();
}

auto SandboxBuilderHandle::SetInputBufferSize(const v8::FunctionCallbackInfo<v8::Value>& info) -> v8::Local<v8::Value> {
	return Configure(info, "size", [](SandboxBuilder& builder, uint64_t size) {
		builder.WithGuestInputBufferSize(static_cast<size_t>(size));
	});
}

auto SandboxBuilderHandle::SetOutputBufferSize(const v8::FunctionCallbackInfo<v8::Value>& info) -> v8::Local<v8::Value> {
	return Configure(info, "size", [](SandboxBuilder& builder, uint64_t size) {
		builder.WithGuestOutputBufferSize(static_cast<size_t>(size));
	});
}

auto SandboxBuilderHandle::SetStackSize(const v8::FunctionCallbackInfo<v8::Value>& info) -> v8::Local<v8::Value> {
	return Configure(info, "size", [](SandboxBuilder& builder, uint64_t size) {
		builder.WithGuestStackSize(size);
	});
}

auto SandboxBuilderHandle::SetHeapSize(const v8::FunctionCallbackInfo<v8::Value>& info) -> v8::Local<v8::Value> {
	return Configure(info, "size", [](SandboxBuilder& builder, uint64_t size) {
		builder.WithGuestHeapSize(size);
	});
}

auto SandboxBuilderHandle::Build(const v8::FunctionCallbackInfo<v8::Value>& /*info*/) -> v8::Local<v8::Value> {
	std::optional<SandboxBuilder> builder;
	{
		auto lock = GetHolder()->write();
		Acquire(lock, kClassName);
		builder = std::move(*lock);
		lock->reset();
	}
	return ThreePhaseTask::Run<1, BuildRunner>(std::move(*builder));
}

} // namespace jsbox

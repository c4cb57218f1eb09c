#pragma once
#include "stage_handle.h"
#include "sandbox/sandbox_builder.h"
#include <v8.h>
#include <memory>

namespace jsbox {

/**
 * `new SandboxBuilder()`. Setters apply immediately and return `this`; `build()` consumes the
 * builder.
 */
class SandboxBuilderHandle final : public StageHandle<SandboxBuilder> {
	public:
		explicit SandboxBuilderHandle(SandboxBuilder builder);
		static auto Definition() -> v8::Local<v8::FunctionTemplate>;
		static auto New(const v8::FunctionCallbackInfo<v8::Value>& info) -> std::unique_ptr<SandboxBuilderHandle>;

		auto SetInputBufferSize(const v8::FunctionCallbackInfo<v8::Value>& info) -> v8::Local<v8::Value>;
		auto SetOutputBufferSize(const v8::FunctionCallbackInfo<v8::Value>& info) -> v8::Local<v8::Value>;
		auto SetStackSize(const v8::FunctionCallbackInfo<v8::Value>& info) -> v8::Local<v8::Value>;
		auto SetHeapSize(const v8::FunctionCallbackInfo<v8::Value>& info) -> v8::Local<v8::Value>;
		auto Build(const v8::FunctionCallbackInfo<v8::Value>& info) -> v8::Local<v8::Value>;

	private:
		template <class Setter>
		auto Configure(const v8::FunctionCallbackInfo<v8::Value>& info, const char* name, Setter setter) -> v8::Local<v8::Value>;
};

} // namespace jsbox

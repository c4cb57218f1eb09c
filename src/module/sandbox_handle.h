#pragma once
#include "stage_handle.h"
#include "sandbox/sandbox.h"
#include <v8.h>

namespace jsbox {

/**
 * A guest with its runtime loaded and a handler registry. Registry operations are synchronous,
 * `getLoadedSandbox()` consumes it.
 */
class SandboxHandle final : public StageHandle<Sandbox> {
	public:
		explicit SandboxHandle(Sandbox sandbox);
		static auto Definition() -> v8::Local<v8::FunctionTemplate>;

		auto AddHandler(const v8::FunctionCallbackInfo<v8::Value>& info) -> v8::Local<v8::Value>;
		auto RemoveHandler(const v8::FunctionCallbackInfo<v8::Value>& info) -> v8::Local<v8::Value>;
		auto ClearHandlers(const v8::FunctionCallbackInfo<v8::Value>& info) -> v8::Local<v8::Value>;
		auto GetLoadedSandbox(const v8::FunctionCallbackInfo<v8::Value>& info) -> v8::Local<v8::Value>;
		auto PoisonedGetter(const v8::FunctionCallbackInfo<v8::Value>& info) -> v8::Local<v8::Value>;
};

} // namespace jsbox

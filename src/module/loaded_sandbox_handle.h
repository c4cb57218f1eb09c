#pragma once
#include "stage_handle.h"
#include "sandbox/loaded_sandbox.h"
#include <v8.h>
#include <atomic>
#include <memory>

namespace jsbox {

/**
 * A sandbox ready to handle events. `interruptHandle` and `poisoned` are answered without taking
 * the sandbox lock, so they stay responsive while a handler runs.
 */
class LoadedSandboxHandle final : public StageHandle<LoadedSandbox> {
	public:
		explicit LoadedSandboxHandle(LoadedSandbox sandbox);
		static auto Definition() -> v8::Local<v8::FunctionTemplate>;

		auto CallHandler(const v8::FunctionCallbackInfo<v8::Value>& info) -> v8::Local<v8::Value>;
		auto Unload(const v8::FunctionCallbackInfo<v8::Value>& info) -> v8::Local<v8::Value>;
		auto Snapshot(const v8::FunctionCallbackInfo<v8::Value>& info) -> v8::Local<v8::Value>;
		auto Restore(const v8::FunctionCallbackInfo<v8::Value>& info) -> v8::Local<v8::Value>;
		auto InterruptHandleGetter(const v8::FunctionCallbackInfo<v8::Value>& info) -> v8::Local<v8::Value>;
		auto PoisonedGetter(const v8::FunctionCallbackInfo<v8::Value>& info) -> v8::Local<v8::Value>;

	private:
		std::shared_ptr<InterruptHandle> interrupt;
		// Refreshed after every operation which may change it
		std::shared_ptr<std::atomic<bool>> poisoned = std::make_shared<std::atomic<bool>>(false);
};

} // namespace jsbox

#pragma once
#include "stage_handle.h"
#include "sandbox/proto_sandbox.h"
#include <v8.h>

namespace jsbox {

/**
 * A guest without its runtime. `loadRuntime()` consumes it.
 */
class ProtoSandboxHandle final : public StageHandle<ProtoSandbox> {
	public:
		explicit ProtoSandboxHandle(ProtoSandbox sandbox);
		static auto Definition() -> v8::Local<v8::FunctionTemplate>;

		auto LoadRuntime(const v8::FunctionCallbackInfo<v8::Value>& info) -> v8::Local<v8::Value>;
};

} // namespace jsbox

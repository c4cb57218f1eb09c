#pragma once
#include "isolate/class_handle.h"
#include "sandbox/guest.h"
#include <v8.h>
#include <memory>

namespace jsbox {

/**
 * `kill()` terminates whatever the sandbox is running. Never waits for the sandbox.
 */
class InterruptHandleHandle final : public ClassHandle {
	public:
		explicit InterruptHandleHandle(std::shared_ptr<InterruptHandle> interrupt) : interrupt{std::move(interrupt)} {}
		static auto Definition() -> v8::Local<v8::FunctionTemplate>;

		auto Kill(const v8::FunctionCallbackInfo<v8::Value>& info) -> v8::Local<v8::Value>;

	private:
		std::shared_ptr<InterruptHandle> interrupt;
};

} // namespace jsbox

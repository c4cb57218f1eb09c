#include "interrupt_handle.h"

namespace jsbox {

auto InterruptHandleHandle::Definition() -> v8::Local<v8::FunctionTemplate> {
	return MakeClass("InterruptHandle", nullptr, {
		Method("kill", MemberEntry<InterruptHandleHandle, &InterruptHandleHandle::Kill>),
	});
}

auto InterruptHandleHandle::Kill(const v8::FunctionCallbackInfo<v8::Value>& info) -> v8::Local<v8::Value> {
	interrupt->Kill();
	return v8::Undefined(info.GetIsolate());
}

} // namespace jsbox

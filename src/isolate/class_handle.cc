#include "class_handle.h"

namespace jsbox {

auto MakeError(ErrorKind kind, const std::string& message) -> v8::Local<v8::Value> {
	auto* isolate = v8::Isolate::GetCurrent();
	auto context = isolate->GetCurrentContext();
	auto error = v8::Exception::Error(v8_string(message));
	// Setting a property on a fresh error object can't fail unless the isolate is terminating
	error.As<v8::Object>()->Set(context, v8_symbol("code"), v8_symbol(ErrorCode(kind))).FromMaybe(false);
	return error;
}

auto MakeError(const std::exception_ptr& error) -> v8::Local<v8::Value> {
	try {
		std::rethrow_exception(error);
	} catch (const SandboxError& cc_error) {
		return MakeError(cc_error.Kind(), cc_error.GetMessage());
	} catch (const std::exception& cc_error) {
		return MakeError(ErrorKind::Internal, cc_error.what());
	}
}

} // namespace jsbox

#include "snapshot_handle.h"

namespace jsbox {

auto SnapshotHandle::Definition() -> v8::Local<v8::FunctionTemplate> {
	return MakeClass("Snapshot", nullptr, {
		Getter("size", MemberEntry<SnapshotHandle, &SnapshotHandle::SizeGetter>),
	});
}

auto SnapshotHandle::SizeGetter(const v8::FunctionCallbackInfo<v8::Value>& info) -> v8::Local<v8::Value> {
	return v8::Number::New(info.GetIsolate(), static_cast<double>(snapshot->Size()));
}

} // namespace jsbox

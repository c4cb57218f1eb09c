#include "guest_isolate.h"
#include "util.h"
#include <spdlog/spdlog.h>
#include <pthread.h>
#include <algorithm>
#include <cstdint>

namespace jsbox {
namespace {

const intptr_t kExternalReferences[] = {
	reinterpret_cast<intptr_t>(&GuestIsolate::HostDispatch),
	reinterpret_cast<intptr_t>(&GuestIsolate::CollectGarbage),
	0,
};

// Index of the runtime exports in the data attached to the serialized context
constexpr size_t kRuntimeExportsIndex = 0;
// Room left for native code below the guest's stack
constexpr uintptr_t kStackPadding = 24 * 1024;
// Extra room given to a guest which is being terminated for using too much memory
constexpr size_t kHeapHeadroom = 256 * 1024 * 1024;

auto GetStackBase() -> void* {
	pthread_attr_t attrs;
	if (pthread_getattr_np(pthread_self(), &attrs) != 0) {
		return nullptr;
	}
	void* base = nullptr;
	size_t size = 0;
	if (pthread_attr_getstack(&attrs, &base, &size) != 0) {
		base = nullptr;
	}
	pthread_attr_destroy(&attrs);
	return base;
}

auto SerializeInternalFieldsCallback(v8::Local<v8::Object> /*holder*/, int /*index*/, void* /*data*/) -> v8::StartupData {
	return {nullptr, 0};
}

struct ToV8Visitor {
	v8::Isolate* isolate;

	auto operator()(std::monostate /*value*/) const -> v8::Local<v8::Value> { return v8::Undefined(isolate); }
	auto operator()(bool value) const -> v8::Local<v8::Value> { return v8::Boolean::New(isolate, value); }
	auto operator()(int64_t value) const -> v8::Local<v8::Value> { return v8::Number::New(isolate, static_cast<double>(value)); }
	auto operator()(double value) const -> v8::Local<v8::Value> { return v8::Number::New(isolate, value); }
	auto operator()(const std::string& value) const -> v8::Local<v8::Value> { return v8_string(value); }
};

} // anonymous namespace

auto ToV8Value(v8::Isolate* isolate, const GuestValue& value) -> v8::Local<v8::Value> {
	return std::visit(ToV8Visitor{isolate}, value);
}

auto FromV8Value(v8::Local<v8::Value> value) -> GuestValue {
	auto* isolate = v8::Isolate::GetCurrent();
	if (value->IsNullOrUndefined()) {
		return std::monostate{};
	} else if (value->IsBoolean()) {
		return value->IsTrue();
	} else if (value->IsInt32()) {
		return static_cast<int64_t>(value.As<v8::Int32>()->Value());
	} else if (value->IsNumber()) {
		return value.As<v8::Number>()->Value();
	} else if (value->IsBigInt()) {
		return value.As<v8::BigInt>()->Int64Value();
	} else if (value->IsString()) {
		return to_string(isolate, value);
	}
	throw GuestError("Unsupported value crossing the guest boundary: " + to_string(isolate, value->TypeOf(isolate)));
}

GuestIsolate::GuestIsolate(GuestEnvironment& environment, std::shared_ptr<const GuestBlob> blob) :
		environment{environment}, blob{std::move(blob)}, tasks{std::make_shared<GuestTaskQueue>()} {
	isolate = v8::Isolate::Allocate();
	PlatformDelegate::RegisterIsolate(isolate, tasks.get());
	// The creator leaves the isolate entered on this thread
	creator = std::make_unique<v8::SnapshotCreator>(isolate, kExternalReferences, this->blob ? this->blob->GetData() : nullptr);
	{
		v8::Locker locker{isolate};
		v8::Isolate::Scope isolate_scope{isolate};
		v8::HandleScope handle_scope{isolate};
		isolate->SetData(0, &environment);
		isolate->SetMicrotasksPolicy(v8::MicrotasksPolicy::kExplicit);
		isolate->AddGCEpilogueCallback(MarkSweepCompactEpilogue, static_cast<void*>(&environment), v8::GCType::kGCTypeMarkSweepCompact);
		isolate->AddNearHeapLimitCallback(NearHeapLimitCallback, static_cast<void*>(&environment));

		auto local_context = v8::Context::New(isolate);
		creator->SetDefaultContext(local_context, {&SerializeInternalFieldsCallback, nullptr});
		context.Reset(isolate, local_context);
		if (this->blob) {
			v8::Local<v8::Object> exports;
			if (local_context->GetDataFromSnapshotOnce<v8::Object>(kRuntimeExportsIndex).ToLocal(&exports)) {
				runtime_exports.Reset(isolate, exports);
			}
		}
	}
	isolate->Exit();
	// Calls may come from any thread
	isolate->DiscardThreadSpecificMetadata();
}

GuestIsolate::~GuestIsolate() {
	if (creator) {
		// nb: The blob must be created even if it's thrown away, because `~SnapshotCreator` will crash
		// if you don't
		auto discarded = CreateBlob(v8::SnapshotCreator::FunctionCodeHandling::kClear);
		delete[] discarded.data;
	}
}

auto GuestIsolate::GetContext() const -> v8::Local<v8::Context> {
	return Deref(context);
}

auto GuestIsolate::GetRuntimeExports() const -> v8::Local<v8::Object> {
	return Deref(runtime_exports);
}

void GuestIsolate::SetRuntimeExports(v8::Local<v8::Object> exports) {
	runtime_exports.Reset(isolate, exports);
}

void GuestIsolate::RunTasks() {
	tasks->Drain();
}

void GuestIsolate::SetStackLimit() const {
	char here;
	auto current = reinterpret_cast<uintptr_t>(&here);
	auto size = static_cast<uintptr_t>(environment.config.stack_size);
	uintptr_t limit = current > size ? current - size : 0;
	void* stack_base = GetStackBase();
	if (stack_base != nullptr) {
		limit = std::max(limit, reinterpret_cast<uintptr_t>(stack_base) + kStackPadding);
	}
	isolate->SetStackLimit(limit);
}

auto GuestIsolate::Serialize() -> std::shared_ptr<const GuestBlob> {
	auto data = CreateBlob(v8::SnapshotCreator::FunctionCodeHandling::kKeep);
	auto serialized = std::make_shared<const GuestBlob>(data);
	if (data.raw_size == 0) {
		throw InternalError("Failure creating snapshot");
	}
	return serialized;
}

auto GuestIsolate::CreateBlob(v8::SnapshotCreator::FunctionCodeHandling handling) -> v8::StartupData {
	{
		v8::Locker locker{isolate};
		v8::Isolate::Scope isolate_scope{isolate};
		v8::HandleScope handle_scope{isolate};
		tasks->Close();
		RunTasks();
		if (handling == v8::SnapshotCreator::FunctionCodeHandling::kKeep && !runtime_exports.IsEmpty()) {
			creator->AddData(GetContext(), GetRuntimeExports());
		}
		// The creator refuses to serialize while handles it doesn't know about are alive
		runtime_exports.Reset();
		context.Reset();
	}
	// Balanced by the `Exit()` in `~SnapshotCreator`
	isolate->Enter();
	auto data = creator->CreateBlob(handling);
	PlatformDelegate::UnregisterIsolate(isolate);
	creator.reset();
	isolate = nullptr;
	return data;
}

void GuestIsolate::MarkSweepCompactEpilogue(v8::Isolate* isolate, v8::GCType gc_type, v8::GCCallbackFlags gc_flags, void* data) {
	auto& environment = *static_cast<GuestEnvironment*>(data);
	v8::HeapStatistics heap;
	isolate->GetHeapStatistics(&heap);
	if (heap.used_heap_size() > environment.config.heap_size) {
		if ((gc_flags & (v8::GCCallbackFlags::kGCCallbackFlagCollectAllAvailableGarbage | v8::GCCallbackFlags::kGCCallbackFlagForced)) == 0) {
			// Force full garbage collection. Reentrant GC doesn't trigger callbacks so check again here.
			isolate->MemoryPressureNotification(v8::MemoryPressureLevel::kCritical);
			MarkSweepCompactEpilogue(isolate, gc_type, v8::GCCallbackFlags::kGCCallbackFlagForced, data);
		} else {
			TerminateForMemory(isolate, environment);
		}
	}
}

auto GuestIsolate::NearHeapLimitCallback(void* data, size_t current_heap_limit, size_t /*initial_heap_limit*/) -> size_t {
	// Raising the limit keeps v8 from crashing the process while the termination unwinds
	auto& environment = *static_cast<GuestEnvironment*>(data);
	TerminateForMemory(v8::Isolate::GetCurrent(), environment);
	return current_heap_limit + kHeapHeadroom;
}

void GuestIsolate::TerminateForMemory(v8::Isolate* isolate, GuestEnvironment& environment) {
	if (!environment.hit_memory_limit.exchange(true)) {
		spdlog::warn("Guest heap limit of {} bytes exceeded, terminating execution", environment.config.heap_size);
	}
	isolate->TerminateExecution();
}

void GuestIsolate::HostDispatch(const v8::FunctionCallbackInfo<v8::Value>& info) {
	auto* isolate = info.GetIsolate();
	auto& environment = *static_cast<GuestEnvironment*>(isolate->GetData(0));
	try {
		if (info.Length() < 1 || !info[0]->IsString()) {
			throw InputError("Host function name must be a string");
		}
		auto name = to_string(isolate, info[0]);
		auto function = environment.host_functions.find(name);
		if (function == environment.host_functions.end()) {
			throw GuestError("Host function '" + name + "' is not registered");
		}
		std::vector<GuestValue> args;
		args.reserve(info.Length() - 1);
		for (int ii = 1; ii < info.Length(); ++ii) {
			args.push_back(FromV8Value(info[ii]));
		}
		info.GetReturnValue().Set(ToV8Value(isolate, function->second(args)));
	} catch (const RuntimeError& cc_error) {
		// A JS error is waiting in the isolate
	} catch (const std::exception& cc_error) {
		auto message = v8::String::NewFromUtf8(isolate, cc_error.what()).FromMaybe(v8::String::Empty(isolate));
		isolate->ThrowException(v8::Exception::Error(message));
	}
}

void GuestIsolate::CollectGarbage(const v8::FunctionCallbackInfo<v8::Value>& info) {
	info.GetIsolate()->LowMemoryNotification();
}

} // namespace jsbox

#include "isolate/class_handle.h"
#include "isolate/node_wrapper.h"
#include "isolate/platform_delegate.h"
#include "isolate/util.h"
#include "interrupt_handle.h"
#include "loaded_sandbox_handle.h"
#include "proto_sandbox_handle.h"
#include "sandbox_builder_handle.h"
#include "sandbox_handle.h"
#include "snapshot_handle.h"
#include "sandbox/metrics.h"
#include <atomic>

using namespace v8;

namespace jsbox {
namespace {

auto StageCountsObject(Local<Context> context, const metrics::StageCounts& counts) -> Local<Object> {
	auto* isolate = context->GetIsolate();
	auto object = Object::New(isolate);
	Unmaybe(object->Set(context, v8_symbol("active"), Number::New(isolate, static_cast<double>(counts.active))));
	Unmaybe(object->Set(context, v8_symbol("total"), Number::New(isolate, static_cast<double>(counts.total))));
	return object;
}

/**
 * `getMetrics()`, a plain object copy of the process-wide counters
 */
void GetMetrics(const FunctionCallbackInfo<Value>& info) {
	detail::RunBarrier([&]() {
		auto* isolate = info.GetIsolate();
		auto context = isolate->GetCurrentContext();
		auto values = metrics::Get();
		auto result = Object::New(isolate);
		auto set = [&](Local<Object> target, const char* name, Local<Value> value) {
			Unmaybe(target->Set(context, v8_symbol(name), value));
		};
		set(result, "sandbox_loads_total", Number::New(isolate, static_cast<double>(values.sandbox_loads_total)));
		set(result, "sandbox_unloads_total", Number::New(isolate, static_cast<double>(values.sandbox_unloads_total)));
		auto terminations = Object::New(isolate);
		for (const auto& entry : values.monitor_terminations_total) {
			Unmaybe(terminations->Set(context, v8_string(entry.first), Number::New(isolate, static_cast<double>(entry.second))));
		}
		set(result, "monitor_terminations_total", terminations);
		auto stages = Object::New(isolate);
		set(stages, "proto", StageCountsObject(context, values.proto));
		set(stages, "unloaded", StageCountsObject(context, values.unloaded));
		set(stages, "loaded", StageCountsObject(context, values.loaded));
		set(result, "stages", stages);
		info.GetReturnValue().Set(result);
	});
}

} // anonymous namespace

// Module entry point
std::atomic<bool> did_global_init{false};
extern "C"
void init(Local<Object> target) {
	Isolate* isolate = Isolate::GetCurrent();
	Local<Context> context = isolate->GetCurrentContext();

	if (!did_global_init.exchange(true)) {
		PlatformDelegate::InitializeDelegate();
	}

	auto expose = [&](const char* name, Local<FunctionTemplate> tmpl) {
		Unmaybe(target->Set(context, v8_symbol(name), Unmaybe(tmpl->GetFunction(context))));
	};
	expose("SandboxBuilder", ClassHandle::GetFunctionTemplate<SandboxBuilderHandle>());
	expose("ProtoJSSandbox", ClassHandle::GetFunctionTemplate<ProtoSandboxHandle>());
	expose("JSSandbox", ClassHandle::GetFunctionTemplate<SandboxHandle>());
	expose("LoadedJSSandbox", ClassHandle::GetFunctionTemplate<LoadedSandboxHandle>());
	expose("InterruptHandle", ClassHandle::GetFunctionTemplate<InterruptHandleHandle>());
	expose("Snapshot", ClassHandle::GetFunctionTemplate<SnapshotHandle>());
	Unmaybe(target->Set(context, v8_symbol("getMetrics"),
		Unmaybe(FunctionTemplate::New(isolate, GetMetrics)->GetFunction(context))));
}

} // namespace jsbox

NODE_MODULE_CONTEXT_AWARE(jsbox, jsbox::init) // NOLINT

#include "three_phase_task.h"
#include "class_handle.h"

namespace jsbox {

auto ThreePhaseTask::Schedule(std::unique_ptr<ThreePhaseTask> self, uv_loop_t* loop, bool ignored) -> v8::Local<v8::Value> {
	auto runner = std::make_unique<Runner>();
	runner->self = std::move(self);
	runner->request.data = runner.get();

	v8::Local<v8::Value> result;
	if (!ignored) {
		auto* isolate = v8::Isolate::GetCurrent();
		runner->isolate = isolate;
		auto context = isolate->GetCurrentContext();
		auto resolver = Unmaybe(v8::Promise::Resolver::New(context));
		runner->resolver.Reset(isolate, resolver);
		runner->context.Reset(isolate, context);
		result = resolver->GetPromise();
	}

	int status = uv_queue_work(loop, &runner->request, Phase2Entry, Phase3Entry);
	if (status != 0) {
		throw InternalError(std::string{"Failed to schedule sandbox task: "} + uv_strerror(status));
	}
	// Reclaimed by `Phase3Entry`
	runner.release();
	return result;
}

void ThreePhaseTask::Phase2Entry(uv_work_t* request) {
	auto* runner = static_cast<Runner*>(request->data);
	try {
		runner->self->Phase2();
	} catch (...) {
		// Rethrown into the promise by phase 3
		runner->error = std::current_exception();
	}
}

void ThreePhaseTask::Phase3Entry(uv_work_t* request, int status) {
	std::unique_ptr<Runner> runner{static_cast<Runner*>(request->data)};
	if (runner->resolver.IsEmpty()) {
		return;
	}
	auto* isolate = runner->isolate;
	v8::HandleScope handle_scope{isolate};
	auto context = Deref(runner->context);
	v8::Context::Scope context_scope{context};
	auto resolver = Deref(runner->resolver);
	// Runs microtasks and `process.nextTick` callbacks once the promise settles
	node::CallbackScope callback_scope{isolate, resolver, {0, 0}};

	auto reject = [&](v8::Local<v8::Value> error) {
		resolver->Reject(context, error).Check();
	};
	if (status == UV_ECANCELED) {
		reject(MakeError(ErrorKind::Internal, "Sandbox task was canceled before it ran"));
		return;
	}
	if (runner->error) {
		reject(MakeError(runner->error));
		return;
	}
	v8::TryCatch try_catch{isolate};
	try {
		auto value = runner->self->Phase3();
		resolver->Resolve(context, value).Check();
	} catch (const RuntimeError&) {
		auto exception = try_catch.Exception();
		try_catch.Reset();
		reject(exception.IsEmpty() ? MakeError(ErrorKind::Internal, "Execution was terminated") : exception);
	} catch (const std::exception&) {
		reject(MakeError(std::current_exception()));
	}
}

} // namespace jsbox

#include "v8_guest.h"
#include "runtime_source.h"
#include "util.h"
#include <optional>
#include <utility>

namespace jsbox {
namespace {

auto DescribeValue(v8::Isolate* isolate, v8::Local<v8::Context> context, v8::Local<v8::Value> value) -> std::string {
	if (value->IsObject()) {
		v8::TryCatch stack_try_catch{isolate};
		v8::Local<v8::Value> stack;
		if (value.As<v8::Object>()->Get(context, v8_symbol("stack")).ToLocal(&stack) && stack->IsString()) {
			return to_string(isolate, stack);
		}
	}
	return to_string(isolate, value);
}

auto DescribeException(v8::Isolate* isolate, v8::Local<v8::Context> context, const v8::TryCatch& try_catch) -> std::string {
	if (try_catch.HasTerminated() || try_catch.Exception().IsEmpty()) {
		return "Execution was terminated";
	}
	return DescribeValue(isolate, context, try_catch.Exception());
}

/**
 * Marks a guest as running for the lifetime of one call, so that `Kill()` knows whether there is
 * anything to terminate.
 */
class RunScope {
	public:
		RunScope(GuestEnvironment& environment, v8::Isolate* isolate) : environment{environment} {
			auto lock = environment.run_state.write();
			lock->running = isolate;
			lock->killed = false;
			environment.hit_memory_limit = false;
			// Kill requests which arrived after the previous call finished must not affect this one
			isolate->CancelTerminateExecution();
		}
		RunScope(const RunScope&) = delete;
		~RunScope() {
			if (!finished) {
				Finish();
			}
		}
		auto operator=(const RunScope&) = delete;

		// Returns true if `Kill()` was called during the call
		auto Finish() -> bool {
			auto lock = environment.run_state.write();
			lock->running = nullptr;
			finished = true;
			return lock->killed;
		}

	private:
		GuestEnvironment& environment;
		bool finished = false;
};

auto StringBytes(const std::vector<GuestValue>& args) -> size_t {
	size_t size = 0;
	for (const auto& arg : args) {
		if (const auto* string = std::get_if<std::string>(&arg)) {
			size += string->size();
		}
	}
	return size;
}

} // anonymous namespace

void V8InterruptHandle::Kill() {
	auto lock = environment->run_state.write();
	if (lock->running != nullptr) {
		lock->killed = true;
		lock->running->TerminateExecution();
	}
}

V8Guest::V8Guest(std::shared_ptr<GuestEnvironment> environment, std::unique_ptr<GuestIsolate> incarnation) :
	environment{std::move(environment)},
	incarnation{std::move(incarnation)},
	interrupt{std::make_shared<V8InterruptHandle>(this->environment)} {}

auto V8Guest::GetIncarnation() -> GuestIsolate& {
	if (!incarnation) {
		throw InternalError("Guest isolate was lost while re-creating it");
	}
	return *incarnation;
}

void V8Guest::Reincarnate(std::shared_ptr<const GuestBlob> blob) {
	incarnation.reset();
	incarnation = std::make_unique<GuestIsolate>(*environment, std::move(blob));
}

auto V8Guest::Call(const std::string& name, const std::vector<GuestValue>& args) -> GuestValue {
	if (poisoned) {
		throw PoisonedError("Guest is poisoned");
	}
	auto input_size = StringBytes(args);
	if (input_size > environment->config.input_buffer_size) {
		throw InputError(
			"Guest input of " + std::to_string(input_size) + " bytes exceeds the input buffer size of " +
			std::to_string(environment->config.input_buffer_size) + " bytes");
	}

	auto& guest_isolate = GetIncarnation();
	auto* isolate = guest_isolate.GetIsolate();
	v8::Locker locker{isolate};
	v8::Isolate::Scope isolate_scope{isolate};
	v8::HandleScope handle_scope{isolate};
	auto context = guest_isolate.GetContext();
	v8::Context::Scope context_scope{context};
	guest_isolate.SetStackLimit();

	RunScope run_scope{*environment, isolate};
	v8::TryCatch try_catch{isolate};
	v8::Local<v8::Value> result;
	std::optional<std::string> failure;
	try {
		auto exports = guest_isolate.GetRuntimeExports();
		if (exports.IsEmpty()) {
			throw InternalError("Guest runtime is not loaded");
		}
		auto function = Unmaybe(exports->Get(context, v8_string(name)));
		if (!function->IsFunction()) {
			throw InternalError("Guest runtime has no function named " + name);
		}
		std::vector<v8::Local<v8::Value>> argv;
		argv.reserve(args.size());
		for (const auto& arg : args) {
			argv.push_back(ToV8Value(isolate, arg));
		}
		result = Unmaybe(function.As<v8::Function>()->Call(context, v8::Undefined(isolate), static_cast<int>(argv.size()), argv.data()));
		isolate->PerformMicrotaskCheckpoint();
		if (result->IsPromise()) {
			auto promise = result.As<v8::Promise>();
			switch (promise->State()) {
				case v8::Promise::kFulfilled:
					result = promise->Result();
					break;
				case v8::Promise::kRejected:
					failure = DescribeValue(isolate, context, promise->Result());
					break;
				case v8::Promise::kPending:
					failure = "The handler function returned a promise which never settled";
					break;
			}
		}
		if (!isolate->IsExecutionTerminating()) {
			guest_isolate.RunTasks();
		}
	} catch (const RuntimeError& cc_error) {
		// A JS error, or a termination, is waiting in `try_catch`
	}

	auto killed = run_scope.Finish();
	if (killed || try_catch.HasTerminated() || environment->hit_memory_limit) {
		isolate->CancelTerminateExecution();
		poisoned = true;
		if (environment->hit_memory_limit) {
			throw GuestAbortError("Guest heap limit exceeded");
		}
		throw CanceledError("Execution canceled by host");
	}
	if (try_catch.HasCaught()) {
		throw GuestError(DescribeException(isolate, context, try_catch));
	}
	if (failure) {
		throw GuestError(*failure);
	}

	auto value = FromV8Value(result);
	if (const auto* string = std::get_if<std::string>(&value)) {
		if (string->size() > environment->config.output_buffer_size) {
			throw GuestError(
				"Guest output of " + std::to_string(string->size()) + " bytes exceeds the output buffer size of " +
				std::to_string(environment->config.output_buffer_size) + " bytes");
		}
	}
	return value;
}

auto V8Guest::Snapshot() -> std::shared_ptr<const GuestSnapshot> {
	if (poisoned) {
		throw PoisonedError("Cannot snapshot a poisoned guest");
	}
	try {
		auto blob = GetIncarnation().Serialize();
		Reincarnate(blob);
		return blob;
	} catch (const std::exception&) {
		// Serializing disposes the isolate, so there is nothing left to run until a restore
		incarnation.reset();
		poisoned = true;
		throw;
	}
}

void V8Guest::Restore(const GuestSnapshot& snapshot) {
	const auto* blob = dynamic_cast<const GuestBlob*>(&snapshot);
	if (blob == nullptr) {
		throw InputError("Snapshot was not taken from a v8 guest");
	}
	Reincarnate(blob->shared_from_this());
	poisoned = false;
}

V8UninitializedGuest::V8UninitializedGuest(const SandboxConfiguration& config) :
	environment{std::make_shared<GuestEnvironment>(config)},
	incarnation{std::make_unique<GuestIsolate>(*environment, nullptr)} {}

void V8UninitializedGuest::RegisterHostFunction(const std::string& name, HostFunction function) {
	if (!incarnation) {
		throw ConsumedError("Host functions must be registered before the runtime is loaded");
	}
	environment->host_functions[name] = std::move(function);
}

auto V8UninitializedGuest::Evolve() -> std::unique_ptr<Guest> {
	if (!incarnation) {
		throw ConsumedError("Guest runtime has already been loaded");
	}
	auto* isolate = incarnation->GetIsolate();
	{
		v8::Locker locker{isolate};
		v8::Isolate::Scope isolate_scope{isolate};
		v8::HandleScope handle_scope{isolate};
		auto context = incarnation->GetContext();
		v8::Context::Scope context_scope{context};
		incarnation->SetStackLimit();
		v8::TryCatch try_catch{isolate};
		try {
			v8::ScriptOrigin origin{isolate, v8_string(kRuntimeSourceName)};
			v8::ScriptCompiler::Source source{v8_string(kRuntimeSource), origin};
			auto boot = Unmaybe(Unmaybe(v8::ScriptCompiler::Compile(context, &source))->Run(context));
			if (!boot->IsFunction()) {
				throw InternalError("Guest runtime did not evaluate to a function");
			}
			v8::Local<v8::Value> argv[] = {
				Unmaybe(v8::FunctionTemplate::New(isolate, GuestIsolate::HostDispatch)->GetFunction(context)),
				Unmaybe(v8::FunctionTemplate::New(isolate, GuestIsolate::CollectGarbage)->GetFunction(context)),
			};
			auto exports = Unmaybe(boot.As<v8::Function>()->Call(context, v8::Undefined(isolate), 2, argv));
			if (!exports->IsObject()) {
				throw InternalError("Guest runtime did not return its exports");
			}
			incarnation->SetRuntimeExports(exports.As<v8::Object>());
			isolate->PerformMicrotaskCheckpoint();
			incarnation->RunTasks();
		} catch (const RuntimeError& cc_error) {
			throw InternalError("Guest runtime failed to boot: " + DescribeException(isolate, context, try_catch));
		}
	}
	return std::make_unique<V8Guest>(environment, std::move(incarnation));
}

auto V8GuestFactory::Create(const SandboxConfiguration& config) -> std::unique_ptr<UninitializedGuest> {
	return std::make_unique<V8UninitializedGuest>(config);
}

} // namespace jsbox

#pragma once
#include "platform_delegate.h"
#include "sandbox/config.h"
#include "sandbox/guest.h"
#include "lib/lockable.h"
#include <v8.h>
#include <atomic>
#include <map>
#include <memory>
#include <string>

namespace jsbox {

/**
 * Serialized guest heap. Owns the blob data v8 handed back.
 */
class GuestBlob final : public GuestSnapshot, public std::enable_shared_from_this<GuestBlob> {
	public:
		explicit GuestBlob(v8::StartupData data) : data{data}, storage{data.data} {}

		auto Size() const -> size_t final { return static_cast<size_t>(data.raw_size); }
		auto GetData() const -> const v8::StartupData* { return &data; }

	private:
		v8::StartupData data;
		std::unique_ptr<const char[]> storage;
};

/**
 * Which isolate, if any, is running guest code right now. Shared by every incarnation of one guest so
 * a single interrupt handle stays valid across snapshot and restore.
 */
struct RunState {
	v8::Isolate* running = nullptr;
	bool killed = false;
};

/**
 * State which outlives any one isolate. Reached from native callbacks through isolate data slot 0,
 * never through the heap, so it never ends up in a snapshot.
 */
struct GuestEnvironment {
	explicit GuestEnvironment(SandboxConfiguration config) : config{config} {}

	SandboxConfiguration config;
	std::map<std::string, HostFunction> host_functions;
	lockable_t<RunState> run_state;
	std::atomic<bool> hit_memory_limit{false};
};

/**
 * One incarnation of a guest: an isolate owned by a `v8::SnapshotCreator`, so that it can be
 * serialized at any point between calls. An incarnation is created either empty or from a blob, and
 * is destroyed by serializing it.
 */
class GuestIsolate {
	public:
		GuestIsolate(GuestEnvironment& environment, std::shared_ptr<const GuestBlob> blob);
		GuestIsolate(const GuestIsolate&) = delete;
		~GuestIsolate();
		auto operator=(const GuestIsolate&) = delete;

		auto GetIsolate() const { return isolate; }
		// The isolate must be locked and entered
		auto GetContext() const -> v8::Local<v8::Context>;
		// Exports of the runtime, or an empty handle before the runtime has booted
		auto GetRuntimeExports() const -> v8::Local<v8::Object>;
		void SetRuntimeExports(v8::Local<v8::Object> exports);
		auto GetEnvironment() const -> GuestEnvironment& { return environment; }
		// Runs pending platform tasks. The isolate must be locked and entered.
		void RunTasks();
		// Limits the guest stack relative to the calling thread's stack
		void SetStackLimit() const;

		// Serializes the heap and tears down the isolate. Nothing else may be called afterwards.
		auto Serialize() -> std::shared_ptr<const GuestBlob>;

		// Native functions reachable from guest code
		static void HostDispatch(const v8::FunctionCallbackInfo<v8::Value>& info);
		static void CollectGarbage(const v8::FunctionCallbackInfo<v8::Value>& info);

	private:
		auto CreateBlob(v8::SnapshotCreator::FunctionCodeHandling handling) -> v8::StartupData;
		static void MarkSweepCompactEpilogue(v8::Isolate* isolate, v8::GCType gc_type, v8::GCCallbackFlags gc_flags, void* data);
		static auto NearHeapLimitCallback(void* data, size_t current_heap_limit, size_t initial_heap_limit) -> size_t;
		static void TerminateForMemory(v8::Isolate* isolate, GuestEnvironment& environment);

		GuestEnvironment& environment;
		// Blob this incarnation was deserialized from, which must outlive the isolate
		std::shared_ptr<const GuestBlob> blob;
		std::shared_ptr<GuestTaskQueue> tasks;
		std::unique_ptr<v8::SnapshotCreator> creator;
		v8::Isolate* isolate = nullptr;
		v8::Global<v8::Context> context;
		v8::Global<v8::Object> runtime_exports;
};

// Conversions for values crossing the guest boundary
auto ToV8Value(v8::Isolate* isolate, const GuestValue& value) -> v8::Local<v8::Value>;
auto FromV8Value(v8::Local<v8::Value> value) -> GuestValue;

} // namespace jsbox

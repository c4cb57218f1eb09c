#pragma once
#include "node_wrapper.h"
#include "util.h"
#include <uv.h>
#include <exception>
#include <memory>

namespace jsbox {

/**
 * Operations on a sandbox block for as long as the guest runs, so they are decomposed into three
 * phases.
 *
 * - Phase 1 [node thread]: copy arguments out of the calling isolate
 * - Phase 2 [libuv pool]: run the blocking sandbox operation
 * - Phase 3 [node thread]: copy results from phase 2 into the calling isolate
 *
 * These runners are invoked via: ThreePhaseTask::Run<async, T>(args...);
 *
 * Where:
 *   async = 1 -- Asynchronous execution, promise returned
 *   async = 2 -- Asynchronous execution, result ignored (Phase3() is never called)
 *
 * `RunIgnored<T>(loop, args...)` is the same as async = 2 but never touches v8, so it's safe to call
 * from a weak callback.
 */
class ThreePhaseTask {
	private:
		/**
		 * Lives from phase 1 until phase 3 is done. Holds the promise of the calling isolate.
		 */
		struct Runner {
			uv_work_t request{};
			std::unique_ptr<ThreePhaseTask> self;
			v8::Isolate* isolate = nullptr;
			v8::Global<v8::Promise::Resolver> resolver;
			v8::Global<v8::Context> context;
			std::exception_ptr error;
		};

		static auto Schedule(std::unique_ptr<ThreePhaseTask> self, uv_loop_t* loop, bool ignored) -> v8::Local<v8::Value>;
		static void Phase2Entry(uv_work_t* request);
		static void Phase3Entry(uv_work_t* request, int status);

	public:
		ThreePhaseTask() = default;
		ThreePhaseTask(const ThreePhaseTask&) = delete;
		auto operator= (const ThreePhaseTask&) -> ThreePhaseTask& = delete;
		virtual ~ThreePhaseTask() = default;

		virtual void Phase2() = 0;
		virtual auto Phase3() -> v8::Local<v8::Value> {
			return v8::Undefined(v8::Isolate::GetCurrent());
		}

		template <int async, typename T, typename ...Args>
		static auto Run(Args&&... args) -> v8::Local<v8::Value> {
			static_assert(async == 1 || async == 2, "Sandbox operations are always asynchronous");
			// Phase1 / ctor called here. Errors thrown by the ctor go straight to the caller.
			auto* loop = node::GetCurrentEventLoop(v8::Isolate::GetCurrent());
			return Schedule(std::make_unique<T>(std::forward<Args>(args)...), loop, async == 2);
		}

		template <typename T, typename ...Args>
		static void RunIgnored(uv_loop_t* loop, Args&&... args) {
			Schedule(std::make_unique<T>(std::forward<Args>(args)...), loop, true);
		}
};

} // namespace jsbox

#pragma once
#include "isolate/class_handle.h"
#include "isolate/node_wrapper.h"
#include "isolate/three_phase_task.h"
#include "lib/lockable.h"
#include <spdlog/spdlog.h>
#include <memory>
#include <optional>
#include <string>

namespace jsbox {
namespace detail {

/**
 * Drops the last reference to a sandbox stage on the thread pool. Tearing down a guest enters its
 * isolate, which must not happen while node's isolate is collecting garbage.
 */
class ReleaseStage final : public ThreePhaseTask {
	public:
		explicit ReleaseStage(std::shared_ptr<void> stage) : stage{std::move(stage)} {}
		void Phase2() final { stage.reset(); }

	private:
		std::shared_ptr<void> stage;
};

} // namespace detail

/**
 * JS wrapper for one sandbox stage. The stage is consumed exactly once by the transition which
 * produces the next stage; after that every method fails with a consumed error.
 */
template <class Stage>
class StageHandle : public ClassHandle {
	public:
		using holder_t = lockable_t<std::optional<Stage>, true>;

		StageHandle(Stage stage, const char* class_name) :
			stage{std::make_shared<holder_t>(std::move(stage))},
			class_name{class_name},
			loop{node::GetCurrentEventLoop(v8::Isolate::GetCurrent())} {}

		StageHandle(const StageHandle&) = delete;
		auto operator=(const StageHandle&) = delete;

		// Pending operations hold their own reference and drop it at the end of phase 2, so whichever
		// side lets go last does it on the pool
		~StageHandle() override {
			try {
				ThreePhaseTask::RunIgnored<detail::ReleaseStage>(loop, std::move(stage));
			} catch (const SandboxError& error) {
				spdlog::warn("{} released on the main thread: {}", class_name, error.what());
			}
		}

		auto GetHolder() const -> const std::shared_ptr<holder_t>& { return stage; }
		auto GetClassName() const -> const char* { return class_name; }

		// Throws if the stage was consumed. The lock must be held.
		template <class Lock>
		static auto Acquire(Lock& lock, const char* class_name) -> Stage& {
			if (!*lock) {
				throw ConsumedError{std::string{class_name} + " has been consumed"};
			}
			return **lock;
		}

	private:
		std::shared_ptr<holder_t> stage;
		const char* class_name;
		uv_loop_t* loop;
};

} // namespace jsbox

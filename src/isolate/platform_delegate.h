#pragma once
#include "lib/lockable.h"
#include "node_wrapper.h"
#include <v8-platform.h>
#include <atomic>
#include <deque>
#include <memory>
#include <utility>

namespace jsbox {

// Normalize this interface from v8
class TaskRunner : public v8::TaskRunner {
	public:
		void PostTask(std::unique_ptr<v8::Task> task) override = 0;
		void PostDelayedTask(std::unique_ptr<v8::Task> task, double delay_in_seconds) override = 0;
		void PostIdleTask(std::unique_ptr<v8::IdleTask> /*task*/) final { std::terminate(); }
		auto IdleTasksEnabled() -> bool override { return false; };
		auto NonNestableTasksEnabled() const -> bool final { return true; }
		void PostNonNestableDelayedTask(std::unique_ptr<v8::Task> /*task*/, double /*delay_in_seconds*/) final { std::terminate(); }
		auto NonNestableDelayedTasksEnabled() const -> bool final { return false; }
};

/**
 * Foreground task queue for one guest isolate. Guest isolates have no event loop, so queued tasks
 * are run by whoever holds the isolate, after each call into it.
 */
class GuestTaskQueue :
		public node::IsolatePlatformDelegate, public TaskRunner,
		public std::enable_shared_from_this<GuestTaskQueue> {
	public:
		// Methods for IsolatePlatformDelegate
		auto GetForegroundTaskRunner() -> std::shared_ptr<v8::TaskRunner> final { return shared_from_this(); }
		auto IdleTasksEnabled() -> bool final { return false; }

		// Methods for v8::TaskRunner
		void PostTask(std::unique_ptr<v8::Task> task) final;
		// Delay is ignored, the task runs at the next drain
		void PostDelayedTask(std::unique_ptr<v8::Task> task, double delay_in_seconds) final;
		void PostNonNestableTask(std::unique_ptr<v8::Task> task) final { PostTask(std::move(task)); }

		// Runs the tasks which are queued right now. Tasks they post wait for the next drain. The isolate
		// must be locked and entered.
		void Drain();
		// v8 keeps posting delayed tasks, this stops accepting them before the isolate is torn down
		void Close();

	private:
		lockable_t<std::deque<std::unique_ptr<v8::Task>>> tasks;
		std::atomic<bool> closed{false};
};

class PlatformDelegate {
	public:
		PlatformDelegate() = default;
		explicit PlatformDelegate(node::MultiIsolatePlatform* node_platform) : node_platform{node_platform} {}
		PlatformDelegate(const PlatformDelegate&) = delete;
		PlatformDelegate(PlatformDelegate&&) = delete;
		~PlatformDelegate() = default;

		auto operator=(const PlatformDelegate&) = delete;
		auto operator=(PlatformDelegate&& delegate) noexcept -> PlatformDelegate& {
			node_platform = std::exchange(delegate.node_platform, nullptr);
			return *this;
		}

		// Must be called from the nodejs thread, inside a context
		static void InitializeDelegate();
		static void RegisterIsolate(v8::Isolate* isolate, node::IsolatePlatformDelegate* isolate_delegate);
		static void UnregisterIsolate(v8::Isolate* isolate);

		node::MultiIsolatePlatform* node_platform = nullptr;
};

} // namespace jsbox

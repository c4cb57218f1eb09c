#pragma once
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

namespace jsbox {

struct poll_state_t;
struct poll_entry_t;

/**
 * A small cooperative scheduler. Tasks are polled on a fixed set of worker threads and say when
 * they want to be polled again; none of them is allowed to block. This hosts timer-like work that
 * must run next to a blocking call on another thread, without spawning a thread per task.
 */
class poll_runtime_t {
	public:
		using clock_t = std::chrono::steady_clock;

		class task_t {
			public:
				task_t() = default;
				task_t(const task_t&) = delete;
				virtual ~task_t() = default;
				auto operator=(const task_t&) = delete;

				// Returns `std::nullopt` once the task is complete, otherwise the next time it should be
				// polled.
				virtual auto poll(clock_t::time_point now) -> std::optional<clock_t::time_point> = 0;
		};

		// Aborts the task when destroyed. If the task is being polled at that moment the destructor
		// waits for the poll to return, so nothing the task references can be used after the handle is
		// gone.
		class handle_t {
			friend poll_runtime_t;
			public:
				handle_t() = default;
				handle_t(const handle_t&) = delete;
				handle_t(handle_t&& that) noexcept = default;
				~handle_t() { abort(); }
				auto operator=(const handle_t&) = delete;
				auto operator=(handle_t&& that) noexcept -> handle_t&;

				void abort();
				auto finished() const -> bool;

			private:
				handle_t(std::shared_ptr<poll_state_t> state, std::shared_ptr<poll_entry_t> entry);
				std::shared_ptr<poll_state_t> state;
				std::shared_ptr<poll_entry_t> entry;
		};

		// Throws `std::system_error` if a worker thread can't be started.
		poll_runtime_t(size_t workers, const char* thread_name);
		poll_runtime_t(const poll_runtime_t&) = delete;
		~poll_runtime_t();
		auto operator=(const poll_runtime_t&) = delete;

		auto spawn(std::unique_ptr<task_t> task) -> handle_t;
		auto size() const -> size_t { return threads.size(); }
		// Number of live tasks waiting for their next poll
		auto pending() const -> size_t;

	private:
		void shutdown();

		std::shared_ptr<poll_state_t> state;
		std::vector<std::thread> threads;
};

} // namespace jsbox

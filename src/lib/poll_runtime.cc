#include "poll_runtime.h"
#include <algorithm>
#include <cstdint>
#include <condition_variable>
#include <mutex>
#include <set>
#include <string>
#include <system_error>
#include <tuple>
#include <utility>
#include <pthread.h>

namespace jsbox {

/**
 * One spawned task. Shared between the handle and the worker threads.
 */
struct poll_entry_t {
	explicit poll_entry_t(std::unique_ptr<poll_runtime_t::task_t> task) : task{std::move(task)} {}

	// Earliest poll first, ties broken by spawn order. `next_poll` must not change while queued.
	struct cmp {
		auto operator()(const std::shared_ptr<poll_entry_t>& left, const std::shared_ptr<poll_entry_t>& right) const {
			return std::tie(left->next_poll, left->id) < std::tie(right->next_poll, right->id);
		}
	};

	std::unique_ptr<poll_runtime_t::task_t> task;
	poll_runtime_t::clock_t::time_point next_poll{};
	uint64_t id = 0;
	bool is_alive = true;
	bool is_queued = false;
	bool is_running = false;
	bool is_finished = false;
	bool is_abort_waiting = false;
};

/**
 * Kept alive by every handle so an outstanding handle can still abort safely after the runtime is
 * gone.
 */
struct poll_state_t {
	// Ordered rather than a heap so an aborted task can be erased right away
	std::set<std::shared_ptr<poll_entry_t>, poll_entry_t::cmp> queue;
	uint64_t next_id = 0;
	std::condition_variable cv;
	std::condition_variable done_cv;
	std::mutex mutex;
	bool should_exit = false;
};

namespace {

void worker_entry(const std::shared_ptr<poll_state_t>& state) {
	std::unique_lock<std::mutex> lock{state->mutex};
	while (!state->should_exit) {
		if (state->queue.empty()) {
			state->cv.wait(lock);
			continue;
		}
		auto next_poll = (*state->queue.begin())->next_poll;
		if (poll_runtime_t::clock_t::now() < next_poll) {
			state->cv.wait_until(lock, next_poll);
			continue;
		}
		auto entry = *state->queue.begin();
		state->queue.erase(state->queue.begin());
		entry->is_queued = false;

		entry->is_running = true;
		lock.unlock();
		auto result = entry->task->poll(poll_runtime_t::clock_t::now());
		lock.lock();
		entry->is_running = false;

		if (result && entry->is_alive) {
			entry->next_poll = *result;
			entry->is_queued = true;
			state->queue.insert(entry);
			// Another worker may be sleeping on a later deadline
			state->cv.notify_one();
		} else {
			entry->is_finished = true;
			entry->task.reset();
		}
		if (entry->is_abort_waiting) {
			state->done_cv.notify_all();
		}
	}
}

} // anonymous namespace

/**
 * poll_runtime_t implementation
 */
poll_runtime_t::poll_runtime_t(size_t workers, const char* thread_name) : state{std::make_shared<poll_state_t>()} {
	threads.reserve(workers);
	try {
		for (size_t ii = 0; ii < workers; ++ii) {
			threads.emplace_back([state = state]() { worker_entry(state); });
			// Linux truncates thread names to 15 characters
			std::string name{thread_name};
			name.resize(std::min<size_t>(name.size(), 15));
			pthread_setname_np(threads.back().native_handle(), name.c_str());
		}
	} catch (const std::system_error&) {
		shutdown();
		throw;
	}
}

poll_runtime_t::~poll_runtime_t() {
	shutdown();
}

void poll_runtime_t::shutdown() {
	{
		std::lock_guard<std::mutex> lock{state->mutex};
		state->should_exit = true;
	}
	state->cv.notify_all();
	for (auto& thread : threads) {
		if (thread.joinable()) {
			thread.join();
		}
	}
	threads.clear();
}

auto poll_runtime_t::spawn(std::unique_ptr<task_t> task) -> handle_t {
	auto entry = std::make_shared<poll_entry_t>(std::move(task));
	{
		std::lock_guard<std::mutex> lock{state->mutex};
		entry->next_poll = clock_t::now();
		entry->id = state->next_id++;
		entry->is_queued = true;
		state->queue.insert(entry);
	}
	state->cv.notify_one();
	return handle_t{state, std::move(entry)};
}

/**
 * handle_t implementation
 */
poll_runtime_t::handle_t::handle_t(std::shared_ptr<poll_state_t> state, std::shared_ptr<poll_entry_t> entry) :
	state{std::move(state)}, entry{std::move(entry)} {}

auto poll_runtime_t::handle_t::operator=(handle_t&& that) noexcept -> handle_t& {
	abort();
	state = std::move(that.state);
	entry = std::move(that.entry);
	return *this;
}

void poll_runtime_t::handle_t::abort() {
	if (!entry) {
		return;
	}
	std::unique_lock<std::mutex> lock{state->mutex};
	entry->is_alive = false;
	if (entry->is_running) {
		entry->is_abort_waiting = true;
		do {
			state->done_cv.wait(lock);
		} while (entry->is_running);
	}
	if (entry->is_queued) {
		state->queue.erase(entry);
		entry->is_queued = false;
	}
	entry->task.reset();
	lock.unlock();
	entry.reset();
	state.reset();
}

auto poll_runtime_t::pending() const -> size_t {
	std::lock_guard<std::mutex> lock{state->mutex};
	return state->queue.size();
}

auto poll_runtime_t::handle_t::finished() const -> bool {
	if (!entry) {
		return true;
	}
	std::lock_guard<std::mutex> lock{state->mutex};
	return entry->is_finished;
}

} // namespace jsbox

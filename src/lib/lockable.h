#pragma once
#include <mutex>
#include <shared_mutex>
#include <type_traits>

namespace jsbox {
namespace detail {

// Pointer semantics to the guarded resource for as long as the lock is held
template <class Resource, class Lock>
class lock_holder_t {
	public:
		template <class Mutex>
		lock_holder_t(Resource& resource, Mutex& mutex) : resource{resource}, lock{mutex} {}

		auto operator*() const -> Resource& { return resource; }
		auto operator->() const -> Resource* { return &resource; }

	private:
		Resource& resource;
		Lock lock;
};

} // namespace detail

/**
 * A resource which can only be reached while holding its mutex. `read()` and `write()` return
 * holders with pointer semantics. Shared lockables allow concurrent readers.
 */
template <class Type, bool Shared = false>
class lockable_t {
	using mutex_t = std::conditional_t<Shared, std::shared_mutex, std::mutex>;
	using read_lock_t = std::conditional_t<Shared, std::shared_lock<mutex_t>, std::lock_guard<mutex_t>>;
	using write_lock_t = std::lock_guard<mutex_t>;

	public:
		lockable_t() = default;
		template <class... Args>
		explicit lockable_t(Args&&... args) : resource{std::forward<Args>(args)...} {}
		lockable_t(const lockable_t&) = delete;
		auto operator=(const lockable_t&) = delete;

		auto read() const {
			return detail::lock_holder_t<const Type, read_lock_t>{resource, mutex};
		}

		auto write() {
			return detail::lock_holder_t<Type, write_lock_t>{resource, mutex};
		}

	private:
		Type resource{};
		mutable mutex_t mutex;
};

} // namespace jsbox

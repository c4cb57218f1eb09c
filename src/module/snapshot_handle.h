#pragma once
#include "isolate/class_handle.h"
#include "sandbox/guest.h"
#include <v8.h>
#include <memory>

namespace jsbox {

/**
 * Opaque guest state taken by `LoadedJSSandbox.snapshot()`. Can be restored any number of times.
 */
class SnapshotHandle final : public ClassHandle {
	public:
		explicit SnapshotHandle(std::shared_ptr<const GuestSnapshot> snapshot) : snapshot{std::move(snapshot)} {}
		static auto Definition() -> v8::Local<v8::FunctionTemplate>;

		auto GetSnapshot() const -> const std::shared_ptr<const GuestSnapshot>& { return snapshot; }
		auto SizeGetter(const v8::FunctionCallbackInfo<v8::Value>& info) -> v8::Local<v8::Value>;

	private:
		std::shared_ptr<const GuestSnapshot> snapshot;
};

} // namespace jsbox

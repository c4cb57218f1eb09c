#include "platform_delegate.h"
#include "error.h"

namespace jsbox {
namespace {
PlatformDelegate delegate;
}

void GuestTaskQueue::PostTask(std::unique_ptr<v8::Task> task) {
	tasks.write()->push_back(std::move(task));
}

void GuestTaskQueue::PostDelayedTask(std::unique_ptr<v8::Task> task, double /*delay_in_seconds*/) {
	if (!closed) {
		PostTask(std::move(task));
	}
}

void GuestTaskQueue::Drain() {
	auto pending = std::exchange(*tasks.write(), {});
	for (auto& task : pending) {
		task->Run();
	}
}

void GuestTaskQueue::Close() {
	closed = true;
}

void PlatformDelegate::InitializeDelegate() {
	auto context = v8::Isolate::GetCurrent()->GetCurrentContext();
	auto* node_platform = node::GetMultiIsolatePlatform(node::GetCurrentEnvironment(context));
	delegate = PlatformDelegate{node_platform};
}

void PlatformDelegate::RegisterIsolate(v8::Isolate* isolate, node::IsolatePlatformDelegate* isolate_delegate) {
	if (delegate.node_platform == nullptr) {
		throw InternalError("The v8 platform has not been initialized");
	}
	delegate.node_platform->RegisterIsolate(isolate, isolate_delegate);
}

void PlatformDelegate::UnregisterIsolate(v8::Isolate* isolate) {
	delegate.node_platform->UnregisterIsolate(isolate);
}

} // namespace jsbox

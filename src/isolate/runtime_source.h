#pragma once

namespace jsbox {

// Script which boots the guest runtime. It is evaluated with the native host dispatcher and the
// garbage collection hook as arguments, and returns the table of functions the host can call.
extern const char* const kRuntimeSource;
extern const char* const kRuntimeSourceName;

} // namespace jsbox

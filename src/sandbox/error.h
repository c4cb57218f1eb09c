#pragma once
#include <exception>
#include <string>

namespace jsbox {

enum class ErrorKind {
	// Invalid builder input, never reaches the guest
	Configuration,
	// Empty, duplicate or missing handler names
	Registry,
	// Malformed or oversized event data, empty handler names
	Input,
	// The last guest call did not run to completion
	Poisoned,
	// A monitor fired or `kill()` was called
	Canceled,
	// The handler threw, failed or returned nothing
	Guest,
	// The guest was torn down mid-call (heap exhausted)
	GuestAbort,
	// An execution monitor could not start, the handler never ran
	MonitorSetup,
	// A stage object was used after it was transitioned away
	Consumed,
	Internal,
};

auto ErrorCode(ErrorKind kind) -> const char*;

/**
 * Base of every error reported by the sandbox. `Kind()` tells callers how to recover without
 * looking at the message.
 */
class SandboxError : public std::exception {
	public:
		SandboxError(ErrorKind kind, std::string message) : kind{kind}, message{std::move(message)} {}

		auto Kind() const { return kind; }
		auto GetMessage() const -> const std::string& { return message; }
		auto what() const noexcept -> const char* final { return message.c_str(); }

		// True when the guest must be restored or unloaded before it can run again
		auto NeedsRecovery() const -> bool {
			return kind == ErrorKind::Poisoned || kind == ErrorKind::Canceled || kind == ErrorKind::GuestAbort;
		}

	private:
		ErrorKind kind;
		std::string message;
};

namespace detail {

template <ErrorKind Which>
class SandboxErrorOfKind : public SandboxError {
	public:
		explicit SandboxErrorOfKind(std::string message) : SandboxError{Which, std::move(message)} {}
};

} // namespace detail

using ConfigurationError = detail::SandboxErrorOfKind<ErrorKind::Configuration>;
using RegistryError = detail::SandboxErrorOfKind<ErrorKind::Registry>;
using InputError = detail::SandboxErrorOfKind<ErrorKind::Input>;
using PoisonedError = detail::SandboxErrorOfKind<ErrorKind::Poisoned>;
using CanceledError = detail::SandboxErrorOfKind<ErrorKind::Canceled>;
using GuestError = detail::SandboxErrorOfKind<ErrorKind::Guest>;
using GuestAbortError = detail::SandboxErrorOfKind<ErrorKind::GuestAbort>;
using MonitorError = detail::SandboxErrorOfKind<ErrorKind::MonitorSetup>;
using ConsumedError = detail::SandboxErrorOfKind<ErrorKind::Consumed>;
using InternalError = detail::SandboxErrorOfKind<ErrorKind::Internal>;

} // namespace jsbox

#include "error.h"

namespace jsbox {

auto ErrorCode(ErrorKind kind) -> const char* {
	switch (kind) {
		case ErrorKind::Configuration:
		case ErrorKind::Registry:
		case ErrorKind::Input:
			return "ERR_INVALID_ARG";
		case ErrorKind::Poisoned:
			return "ERR_POISONED";
		case ErrorKind::Canceled:
			return "ERR_CANCELLED";
		case ErrorKind::Guest:
			return "ERR_GUEST";
		case ErrorKind::GuestAbort:
			return "ERR_GUEST_ABORT";
		case ErrorKind::MonitorSetup:
			return "ERR_MONITOR";
		case ErrorKind::Consumed:
			return "ERR_CONSUMED";
		case ErrorKind::Internal:
			break;
	}
	return "ERR_INTERNAL";
}

} // namespace jsbox

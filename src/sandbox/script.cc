#include "script.h"
#include "error.h"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

namespace jsbox {

Script::Script(std::shared_ptr<const std::string> content, std::optional<std::string> base_path) :
	content{std::move(content)}, base_path{std::move(base_path)} {}

auto Script::FromContent(std::string content) -> Script {
	return Script{std::make_shared<const std::string>(std::move(content)), std::nullopt};
}

auto Script::FromFile(const std::string& path) -> Script {
	std::ifstream file{path, std::ios::in | std::ios::binary};
	if (!file) {
		throw ConfigurationError("Failed to read script from '" + path + "': " + std::strerror(errno));
	}
	std::ostringstream buffer;
	buffer << file.rdbuf();
	if (file.bad()) {
		throw ConfigurationError("Failed to read script from '" + path + "': read error");
	}

	std::optional<std::string> base_path;
	auto slash = path.find_last_of('/');
	if (slash == std::string::npos) {
		base_path = ".";
	} else if (slash == 0) {
		base_path = "/";
	} else {
		base_path = path.substr(0, slash);
	}
	return Script{std::make_shared<const std::string>(buffer.str()), std::move(base_path)};
}

auto Script::WithVirtualBase(std::string path) && -> Script {
	base_path = std::move(path);
	return std::move(*this);
}

} // namespace jsbox

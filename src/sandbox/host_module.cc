#include "host_module.h"
#include <algorithm>
#include <stdexcept>

namespace jsbox {

/**
 * HostModule implementation
 */
auto HostModule::Register(std::string name, HostJsFunction function) -> HostModule& {
	functions[std::move(name)] = std::move(function);
	return *this;
}

auto HostModule::Get(const std::string& name) const -> const HostJsFunction* {
	auto ii = functions.find(name);
	return ii == functions.end() ? nullptr : &ii->second;
}

auto HostModule::FunctionNames() const -> std::vector<std::string> {
	std::vector<std::string> names;
	names.reserve(functions.size());
	for (const auto& entry : functions) {
		names.push_back(entry.first);
	}
	return names;
}

/**
 * EmbeddedModuleLoader implementation
 */
EmbeddedModuleLoader::EmbeddedModuleLoader(std::map<std::string, std::string> modules) {
	for (auto& entry : modules) {
		this->modules.emplace(NormalizePath(entry.first), std::move(entry.second));
	}
}

auto EmbeddedModuleLoader::NormalizePath(const std::string& path) -> std::string {
	std::string slashed = path;
	std::replace(slashed.begin(), slashed.end(), '\\', '/');

	// Collapse `.` and `..` segments, drop leading `./` and `/`
	std::vector<std::string> segments;
	size_t begin = 0;
	while (begin <= slashed.size()) {
		size_t end = slashed.find('/', begin);
		if (end == std::string::npos) {
			end = slashed.size();
		}
		std::string segment = slashed.substr(begin, end - begin);
		if (segment == "..") {
			if (!segments.empty()) {
				segments.pop_back();
			}
		} else if (!segment.empty() && segment != ".") {
			segments.push_back(std::move(segment));
		}
		begin = end + 1;
	}

	std::string normalized;
	for (const auto& segment : segments) {
		if (!normalized.empty()) {
			normalized += '/';
		}
		normalized += segment;
	}
	return normalized;
}

auto EmbeddedModuleLoader::Resolve(const std::string& base, const std::string& name) -> std::string {
	bool relative = name.rfind("./", 0) == 0 || name.rfind("../", 0) == 0;
	std::string joined = relative ? base + "/" + name : name;
	std::string path = NormalizePath(joined);
	if (modules.count(path) != 0) {
		return path;
	}
	for (const char* extension : {".js", ".mjs"}) {
		if (modules.count(path + extension) != 0) {
			return path + extension;
		}
	}
	throw std::runtime_error("Cannot find module '" + name + "' from '" + base + "'");
}

auto EmbeddedModuleLoader::Load(const std::string& path) -> std::string {
	auto ii = modules.find(NormalizePath(path));
	if (ii == modules.end()) {
		throw std::runtime_error("Failed to read module '" + path + "'");
	}
	return ii->second;
}

} // namespace jsbox

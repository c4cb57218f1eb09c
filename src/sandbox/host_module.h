#pragma once
#include <nlohmann/json.hpp>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace jsbox {

// Receives the guest's arguments as a JSON array
using HostJsFunction = std::function<nlohmann::json(const nlohmann::json& args)>;

/**
 * A named group of host functions which guest code can `require()`.
 */
class HostModule {
	public:
		// Replaces any function already registered under `name`
		auto Register(std::string name, HostJsFunction function) -> HostModule&;
		auto Get(const std::string& name) const -> const HostJsFunction*;
		auto FunctionNames() const -> std::vector<std::string>;

	private:
		std::map<std::string, HostJsFunction> functions;
};

using HostModules = std::map<std::string, HostModule>;

/**
 * Resolves and loads modules requested by guest code. Failures are reported back to the guest as
 * a module-not-found error.
 */
class ModuleLoader {
	public:
		ModuleLoader() = default;
		ModuleLoader(const ModuleLoader&) = delete;
		virtual ~ModuleLoader() = default;
		auto operator=(const ModuleLoader&) = delete;

		// `base` is the directory of the requesting module
		virtual auto Resolve(const std::string& base, const std::string& name) -> std::string = 0;
		virtual auto Load(const std::string& path) -> std::string = 0;
};

/**
 * Serves modules out of an in-memory path -> source table.
 */
class EmbeddedModuleLoader : public ModuleLoader {
	public:
		explicit EmbeddedModuleLoader(std::map<std::string, std::string> modules);

		auto Resolve(const std::string& base, const std::string& name) -> std::string final;
		auto Load(const std::string& path) -> std::string final;

		static auto NormalizePath(const std::string& path) -> std::string;

	private:
		std::map<std::string, std::string> modules;
};

} // namespace jsbox

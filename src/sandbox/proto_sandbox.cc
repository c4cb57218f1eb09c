#include "proto_sandbox.h"
#include "error.h"
#include "sandbox.h"
#include <chrono>
#include <iostream>
#include <utility>

namespace jsbox {
namespace {

auto StringArgument(const std::vector<GuestValue>& args, size_t index, const char* function) -> const std::string& {
	if (index >= args.size() || !std::holds_alternative<std::string>(args[index])) {
		throw InputError(std::string{function} + ": argument " + std::to_string(index) + " must be a string");
	}
	return std::get<std::string>(args[index]);
}

} // anonymous namespace

ProtoSandbox::ProtoSandbox(std::unique_ptr<UninitializedGuest> guest, HostPrintFunction host_print) :
		guest{std::move(guest)} {
	this->guest->RegisterHostFunction("CurrentTimeMicros", [](const std::vector<GuestValue>& /*args*/) -> GuestValue {
		auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
		return static_cast<int64_t>(std::chrono::duration_cast<std::chrono::microseconds>(since_epoch).count());
	});
	if (!host_print) {
		host_print = [](const std::string& message) {
			std::cout << message << std::flush;
		};
	}
	this->guest->RegisterHostFunction("Print", [host_print = std::move(host_print)](const std::vector<GuestValue>& args) -> GuestValue {
		host_print(StringArgument(args, 0, "Print"));
		return std::monostate{};
	});
}

auto ProtoSandbox::GetGuest() -> UninitializedGuest& {
	if (!guest) {
		throw ConsumedError("Sandbox has already loaded its runtime");
	}
	return *guest;
}

auto ProtoSandbox::HostModule(const std::string& name) -> jsbox::HostModule& {
	GetGuest();
	return host_modules[name];
}

auto ProtoSandbox::Register(const std::string& module, std::string name, HostJsFunction function) -> ProtoSandbox& {
	HostModule(module).Register(std::move(name), std::move(function));
	return *this;
}

void ProtoSandbox::SetModuleLoader(std::shared_ptr<ModuleLoader> loader) {
	if (!loader) {
		throw ConfigurationError("Module loader must not be null");
	}
	auto& guest = GetGuest();
	guest.RegisterHostFunction("ResolveModule", [loader](const std::vector<GuestValue>& args) -> GuestValue {
		return loader->Resolve(StringArgument(args, 0, "ResolveModule"), StringArgument(args, 1, "ResolveModule"));
	});
	guest.RegisterHostFunction("LoadModule", [loader](const std::vector<GuestValue>& args) -> GuestValue {
		return loader->Load(StringArgument(args, 0, "LoadModule"));
	});
}

auto ProtoSandbox::LoadRuntime() && -> Sandbox {
	GetGuest();
	auto modules = std::make_shared<const HostModules>(std::move(host_modules));
	guest->RegisterHostFunction("CallHostJsFunction", [modules](const std::vector<GuestValue>& args) -> GuestValue {
		const auto& module_name = StringArgument(args, 0, "CallHostJsFunction");
		const auto& function_name = StringArgument(args, 1, "CallHostJsFunction");
		auto module = modules->find(module_name);
		if (module == modules->end()) {
			throw GuestError("Host module '" + module_name + "' not found");
		}
		const auto* function = module->second.Get(function_name);
		if (function == nullptr) {
			throw GuestError("Host function '" + function_name + "' not found in module '" + module_name + "'");
		}
		auto arguments = nlohmann::json::parse(StringArgument(args, 2, "CallHostJsFunction"));
		return (*function)(arguments).dump();
	});

	auto loaded = std::exchange(guest, nullptr)->Evolve();
	auto manifest = nlohmann::json::object();
	for (const auto& entry : *modules) {
		manifest[entry.first] = entry.second.FunctionNames();
	}
	loaded->Call("RegisterHostModules", {manifest.dump()});
	return Sandbox{std::move(loaded)};
}

} // namespace jsbox

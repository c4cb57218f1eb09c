#include "sandbox/host_module.h"
#include <gtest/gtest.h>
#include <stdexcept>

namespace jsbox {
namespace {

TEST(HostModuleTest, RegisterOverwrites) {
	HostModule module;
	module
		.Register("b", [](const nlohmann::json& /*args*/) -> nlohmann::json { return 1; })
		.Register("a", [](const nlohmann::json& /*args*/) -> nlohmann::json { return 2; })
		.Register("b", [](const nlohmann::json& /*args*/) -> nlohmann::json { return 3; });
	EXPECT_EQ(module.FunctionNames(), (std::vector<std::string>{"a", "b"}));
	ASSERT_NE(module.Get("b"), nullptr);
	EXPECT_EQ((*module.Get("b"))(nlohmann::json::array()), 3);
	EXPECT_EQ(module.Get("c"), nullptr);
}

TEST(EmbeddedModuleLoaderTest, NormalizePath) {
	EXPECT_EQ(EmbeddedModuleLoader::NormalizePath("./a/b.js"), "a/b.js");
	EXPECT_EQ(EmbeddedModuleLoader::NormalizePath("/a/./b/../c.js"), "a/c.js");
	EXPECT_EQ(EmbeddedModuleLoader::NormalizePath("a\\b\\c.js"), "a/b/c.js");
	EXPECT_EQ(EmbeddedModuleLoader::NormalizePath("../../x.js"), "x.js");
}

TEST(EmbeddedModuleLoaderTest, Resolve) {
	EmbeddedModuleLoader loader{std::map<std::string, std::string>{
		{"./lib/math.js", "math"},
		{"lib/data.json", "data"},
		{"shared/util.mjs", "util"},
	}};
	EXPECT_EQ(loader.Resolve("lib", "./math"), "lib/math.js");
	EXPECT_EQ(loader.Resolve("lib", "./math.js"), "lib/math.js");
	EXPECT_EQ(loader.Resolve("lib", "./data.json"), "lib/data.json");
	EXPECT_EQ(loader.Resolve("lib/nested", "../../shared/util"), "shared/util.mjs");
	// Bare names resolve from the root
	EXPECT_EQ(loader.Resolve("anywhere", "lib/math"), "lib/math.js");
	EXPECT_THROW(loader.Resolve("lib", "./missing"), std::runtime_error);
}

TEST(EmbeddedModuleLoaderTest, Load) {
	EmbeddedModuleLoader loader{std::map<std::string, std::string>{{"lib/math.js", "math"}}};
	EXPECT_EQ(loader.Load("lib/math.js"), "math");
	EXPECT_EQ(loader.Load("./lib/math.js"), "math");
	EXPECT_THROW(loader.Load("lib/other.js"), std::runtime_error);
}

} // anonymous namespace
} // namespace jsbox

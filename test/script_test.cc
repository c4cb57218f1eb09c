#include "sandbox/error.h"
#include "sandbox/script.h"
#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <string>
#include <unistd.h>

namespace jsbox {
namespace {

TEST(ScriptTest, FromContent) {
	auto script = Script::FromContent("function handler(event) { return event; }");
	EXPECT_EQ(script.Content(), "function handler(event) { return event; }");
	EXPECT_FALSE(script.BasePath());

	auto copy = script;
	EXPECT_EQ(&copy.Content(), &script.Content());
}

TEST(ScriptTest, WithVirtualBase) {
	auto script = Script::FromContent("x").WithVirtualBase("handlers/api");
	ASSERT_TRUE(script.BasePath());
	EXPECT_EQ(*script.BasePath(), "handlers/api");
}

TEST(ScriptTest, FromFile) {
	char path[] = "/tmp/jsbox-script-XXXXXX";
	int fd = mkstemp(path);
	ASSERT_NE(fd, -1);
	close(fd);
	{
		std::ofstream file{path};
		file << "export function handler() { return 1; }";
	}
	auto script = Script::FromFile(path);
	std::remove(path);
	EXPECT_EQ(script.Content(), "export function handler() { return 1; }");
	ASSERT_TRUE(script.BasePath());
	EXPECT_EQ(*script.BasePath(), "/tmp");
}

TEST(ScriptTest, MissingFile) {
	try {
		Script::FromFile("/nonexistent/jsbox/handler.js");
		FAIL() << "Read a missing file";
	} catch (const ConfigurationError& error) {
		EXPECT_EQ(error.GetMessage().rfind("Failed to read script from '/nonexistent/jsbox/handler.js': ", 0), 0U);
	}
}

} // anonymous namespace
} // namespace jsbox

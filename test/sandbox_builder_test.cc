#include "fake_guest.h"
#include "sandbox/error.h"
#include "sandbox/proto_sandbox.h"
#include "sandbox/sandbox_builder.h"
#include <gtest/gtest.h>

namespace jsbox {
namespace {

TEST(SandboxBuilderTest, Defaults) {
	SandboxBuilder builder{std::make_shared<test::FakeGuestFactory>()};
	const auto& config = builder.GetConfig();
	EXPECT_EQ(config.input_buffer_size, kDefaultInputBufferSize);
	EXPECT_EQ(config.output_buffer_size, kDefaultOutputBufferSize);
	EXPECT_EQ(config.stack_size, kMinStackSize);
	EXPECT_EQ(config.heap_size, kMinHeapSize);
}

TEST(SandboxBuilderTest, ZeroSizesAreRejected) {
	SandboxBuilder builder{std::make_shared<test::FakeGuestFactory>()};
	EXPECT_THROW(builder.WithGuestInputBufferSize(0), ConfigurationError);
	EXPECT_THROW(builder.WithGuestOutputBufferSize(0), ConfigurationError);
	EXPECT_THROW(builder.WithGuestStackSize(0), ConfigurationError);
	EXPECT_THROW(builder.WithGuestHeapSize(0), ConfigurationError);
}

TEST(SandboxBuilderTest, SizesBelowMinimumAreIgnored) {
	SandboxBuilder builder{std::make_shared<test::FakeGuestFactory>()};
	builder.WithGuestStackSize(kMinStackSize - 1).WithGuestHeapSize(kMinHeapSize);
	EXPECT_EQ(builder.GetConfig().stack_size, kMinStackSize);
	EXPECT_EQ(builder.GetConfig().heap_size, kMinHeapSize);

	builder.WithGuestStackSize(kMinStackSize * 2).WithGuestHeapSize(kMinHeapSize + 1);
	EXPECT_EQ(builder.GetConfig().stack_size, kMinStackSize * 2);
	EXPECT_EQ(builder.GetConfig().heap_size, kMinHeapSize + 1);

	builder.WithGuestInputBufferSize(1).WithGuestOutputBufferSize(2);
	EXPECT_EQ(builder.GetConfig().input_buffer_size, 1U);
	EXPECT_EQ(builder.GetConfig().output_buffer_size, 2U);
}

TEST(SandboxBuilderTest, BuildPassesConfiguration) {
	auto factory = std::make_shared<test::FakeGuestFactory>();
	SandboxBuilder builder{factory};
	builder.WithGuestInputBufferSize(1024);
	auto proto = std::move(builder).Build();
	ASSERT_NE(factory->last, nullptr);
	EXPECT_EQ(factory->last->config.input_buffer_size, 1024U);
	EXPECT_EQ(factory->last->host_functions.count("Print"), 1U);
}

TEST(SandboxBuilderTest, BuildWithoutEngine) {
	try {
		SandboxBuilder{nullptr}.Build();
		FAIL() << "Built a sandbox without an engine";
	} catch (const SandboxError& error) {
		EXPECT_EQ(error.Kind(), ErrorKind::Configuration);
		EXPECT_EQ(error.GetMessage(), "No guest engine is available");
	}
}

TEST(SandboxErrorTest, Codes) {
	EXPECT_STREQ(ErrorCode(ErrorKind::Configuration), "ERR_INVALID_ARG");
	EXPECT_STREQ(ErrorCode(ErrorKind::Registry), "ERR_INVALID_ARG");
	EXPECT_STREQ(ErrorCode(ErrorKind::Input), "ERR_INVALID_ARG");
	EXPECT_STREQ(ErrorCode(ErrorKind::Poisoned), "ERR_POISONED");
	EXPECT_STREQ(ErrorCode(ErrorKind::Canceled), "ERR_CANCELLED");
	EXPECT_STREQ(ErrorCode(ErrorKind::Guest), "ERR_GUEST");
	EXPECT_STREQ(ErrorCode(ErrorKind::GuestAbort), "ERR_GUEST_ABORT");
	EXPECT_STREQ(ErrorCode(ErrorKind::MonitorSetup), "ERR_MONITOR");
	EXPECT_STREQ(ErrorCode(ErrorKind::Consumed), "ERR_CONSUMED");
	EXPECT_STREQ(ErrorCode(ErrorKind::Internal), "ERR_INTERNAL");
}

TEST(SandboxErrorTest, AliasesCarryTheirKind) {
	EXPECT_EQ(ConfigurationError{""}.Kind(), ErrorKind::Configuration);
	EXPECT_EQ(RegistryError{""}.Kind(), ErrorKind::Registry);
	EXPECT_EQ(InputError{""}.Kind(), ErrorKind::Input);
	EXPECT_EQ(PoisonedError{""}.Kind(), ErrorKind::Poisoned);
	EXPECT_EQ(CanceledError{""}.Kind(), ErrorKind::Canceled);
	EXPECT_EQ(GuestError{""}.Kind(), ErrorKind::Guest);
	EXPECT_EQ(GuestAbortError{""}.Kind(), ErrorKind::GuestAbort);
	EXPECT_EQ(MonitorError{""}.Kind(), ErrorKind::MonitorSetup);
	EXPECT_EQ(ConsumedError{""}.Kind(), ErrorKind::Consumed);
	EXPECT_EQ(InternalError{""}.Kind(), ErrorKind::Internal);
}

TEST(SandboxErrorTest, NeedsRecovery) {
	EXPECT_TRUE(PoisonedError{""}.NeedsRecovery());
	EXPECT_TRUE(CanceledError{""}.NeedsRecovery());
	EXPECT_TRUE(GuestAbortError{""}.NeedsRecovery());
	EXPECT_FALSE(GuestError{""}.NeedsRecovery());
	EXPECT_FALSE(InputError{""}.NeedsRecovery());
	EXPECT_STREQ(MonitorError{"nope"}.what(), "nope");
}

} // anonymous namespace
} // namespace jsbox

/**
 * Tests for the exception hierarchy and error reporting
 */

#include "tests_common.hpp"
#include "error.hpp"

/**
 * Tests that copies of an exception keep their own copy of the cause.
 */
TEST(ErrorTest, CauseChain)
{
	InputException cause{"Permission denied: %s", "replays"};
	const ReelException ex{cause, "Failed to create folder: %s", "replays"};
	const ReelException copy = ex;

	EXPECT_STREQ("Failed to create folder: replays", copy.what());
	ASSERT_TRUE(copy.has_cause());
	EXPECT_STREQ("Permission denied: replays", copy.cause().what());
	EXPECT_NE(&ex.cause(), &copy.cause());
	EXPECT_FALSE(copy.cause().has_cause());
}

TEST(ErrorTest, Clone)
{
	const NotFoundException ex{"Alder vs Alder", 2};
	const std::unique_ptr<ReelException> clone = ex.clone();

	EXPECT_STREQ("NotFoundException", clone->class_name());
	EXPECT_STREQ(ex.what(), clone->what());
}

/**
 * Tests that the error report on standard error lists the causes.
 */
TEST(ErrorTest, ShowError)
{
	const ReelException ex{ReelException{"Not a directory"}, "Failed to create folder: %s", "replays"};

	testing::internal::CaptureStderr();
	show_error(ex);
	const std::string report = testing::internal::GetCapturedStderr();

	EXPECT_EQ("ReelException: Failed to create folder: replays\n"
	          "  caused by ReelException: Not a directory\n", report);
}

TEST(ErrorTest, Enforce)
{
	EXPECT_NO_THROW(enforce(1 + 1 == 2));
	EXPECT_THROW(enforce(1 + 1 == 3), EnforceException);
}

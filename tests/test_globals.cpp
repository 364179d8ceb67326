/**
 * Tests for global utility functions
 */

#include "globals.hpp"
#include "gtest/gtest.h"

/**
 * Tests trimming of surrounding whitespace.
 */
TEST(GlobalsTest, Trim)
{
	EXPECT_EQ("Alder vs Alder", trim("  Alder vs Alder \t"));
	EXPECT_EQ("a  b", trim("a  b"));
	EXPECT_EQ("", trim(" \t \r"));
	EXPECT_EQ("", trim(""));
}

TEST(GlobalsTest, ToLower)
{
	EXPECT_EQ("alder vs cynthia 2", to_lower("Alder VS Cynthia 2"));
}

/**
 * Tests that splitting keeps empty fields so that joining restores the line.
 */
TEST(GlobalsTest, SplitJoin)
{
	const std::vector<std::string> expected{"", "player", "p1", "", "2", ""};
	const std::vector<std::string> fields = split("|player|p1||2|", '|');

	EXPECT_EQ(expected, fields);
	EXPECT_EQ("|player|p1||2|", join(fields, '|'));
	EXPECT_EQ(std::vector<std::string>{"plain"}, split("plain", '|'));
}

/**
 * Tests conversion of sides to protocol tokens.
 */
TEST(GlobalsTest, Side)
{
	EXPECT_STREQ("p1", side_to_string(Side::P1));
	EXPECT_STREQ("p2", side_to_string(Side::P2));
}

TEST(GlobalsTest, StringFormat)
{
	EXPECT_EQ("  7  Alder vs Alder", string_format("%3d  %s", 7, "Alder vs Alder"));
}

/**
 * Tests for battle selection and matchup statistics
 */

#include "tests_common.hpp"
#include "matchup.hpp"
#include "error.hpp"
#include <sstream>

class MatchupTest : public ::testing::Test
{

public:

	explicit MatchupTest()
	: source(
		"[[[[[\nAlder vs Alder\n|turn|1\n]]]]]\n"
		"[[[[[\nIris vs Cynthia\n|turn|2\n]]]]]\n"
		"[[[[[\n  alder VS alder  \n|turn|3\n]]]]]\n"
		"[[[[[\nIris vs Cynthia\n|turn|4\n]]]]]\n"
		"[[[[[\nIris vs Cynthia\n|turn|5\n]]]]]\n"
		"[[[[[\nAlder vs Alder\n|turn|6\n]]]]]\n")
	{
	}

protected:

	TextBattleSource source;

};

/**
 * Tests that headers are counted exactly as they appear in the log.
 */
TEST_F(MatchupTest, Count)
{
	BattleReader reader{source};
	const MatchupIndex index = MatchupIndex::build(reader);

	EXPECT_EQ(6, index.total());
	EXPECT_EQ(3, index.unique());
	EXPECT_EQ(2, index.count("Alder vs Alder"));
	EXPECT_EQ(3, index.count("Iris vs Cynthia"));
	EXPECT_EQ(1, index.count("alder VS alder"));
	EXPECT_EQ(0, index.count("Cynthia vs Iris"));
}

/**
 * Tests the order of the most frequent matchups.
 */
TEST_F(MatchupTest, Top)
{
	BattleReader reader{source};
	const MatchupIndex index = MatchupIndex::build(reader);

	const std::vector<MatchupCount> top = index.top(80);
	ASSERT_EQ(3, top.size());
	EXPECT_EQ("Iris vs Cynthia", top[0].header);
	EXPECT_EQ(3, top[0].count);
	EXPECT_EQ("Alder vs Alder", top[1].header);
	EXPECT_EQ(2, top[1].count);
	EXPECT_EQ("alder VS alder", top[2].header);

	EXPECT_EQ(1, index.top(1).size());
	EXPECT_TRUE(index.top(0).empty());
}

/**
 * Tests that matchups with equal counts keep the order of their first battle.
 */
TEST(MatchupIndexTest, TiesInFirstSeenOrder)
{
	MatchupIndex index;
	index.add("C vs D");
	index.add("A vs B");
	index.add("E vs F");
	index.add("A vs B");
	index.add("E vs F");
	index.add("C vs D");

	const std::vector<MatchupCount> top = index.top(3);
	ASSERT_EQ(3, top.size());
	EXPECT_EQ("C vs D", top[0].header);
	EXPECT_EQ("A vs B", top[1].header);
	EXPECT_EQ("E vs F", top[2].header);
}

TEST_F(MatchupTest, Print)
{
	BattleReader reader{source};
	const MatchupIndex index = MatchupIndex::build(reader);
	std::ostringstream stream;

	print_matchups(stream, index, 2);

	const std::string expected =
R"(Found 6 battle(s) across 3 unique matchup header(s):
    3  Iris vs Cynthia
    2  Alder vs Alder
)";
	EXPECT_EQ(expected, stream.str());
}

TEST(MatchupIndexTest, PrintEmpty)
{
	std::ostringstream stream;
	print_matchups(stream, MatchupIndex{}, 80);
	EXPECT_EQ("No battles found.\n", stream.str());
}

TEST_F(MatchupTest, SelectByIndex)
{
	EXPECT_EQ(std::vector<std::string>{"|turn|1"}, select_by_index(source, 0).protocol_lines);
	EXPECT_EQ(std::vector<std::string>{"|turn|4"}, select_by_index(source, 3).protocol_lines);
	EXPECT_EQ(std::vector<std::string>{"|turn|6"}, select_by_index(source, 5).protocol_lines);
}

/**
 * Tests that the exception for a missing index tells what was attempted.
 */
TEST_F(MatchupTest, SelectByIndexOutOfRange)
{
	try {
		select_by_index(source, 6);
		FAIL() << "Expected OutOfRangeException";
	}
	catch(const OutOfRangeException& ex) {
		EXPECT_EQ(6, ex.index());
		EXPECT_EQ(6, ex.available());
		EXPECT_NE(std::string::npos, std::string(ex.what()).find("6"));
	}
}

/**
 * Tests that matchups are compared without case and surrounding whitespace.
 */
TEST_F(MatchupTest, SelectByMatchup)
{
	EXPECT_EQ(std::vector<std::string>{"|turn|1"}, select_by_matchup(source, "Alder vs Alder", 0).protocol_lines);
	EXPECT_EQ(std::vector<std::string>{"|turn|3"}, select_by_matchup(source, "Alder vs Alder", 1).protocol_lines);
	EXPECT_EQ(std::vector<std::string>{"|turn|6"}, select_by_matchup(source, " ALDER VS ALDER ", 2).protocol_lines);
	EXPECT_EQ(std::vector<std::string>{"|turn|5"}, select_by_matchup(source, "iris vs cynthia", 2).protocol_lines);
}

/**
 * Tests that the exception for a missing matchup tells what was attempted.
 */
TEST(MatchupIndexTest, SelectByMatchupNotFound)
{
	TextBattleSource source{"[[[[[\nAlder vs Alder\n|turn|1\n]]]]]\n"};

	try {
		select_by_matchup(source, "Alder vs Alder", 1);
		FAIL() << "Expected NotFoundException";
	}
	catch(const NotFoundException& ex) {
		EXPECT_EQ("Alder vs Alder", ex.matchup());
		EXPECT_EQ(1, ex.occurrence());
		EXPECT_STREQ("No matchup \"Alder vs Alder\" found at occurrence 1.", ex.what());
	}

	EXPECT_THROW(select_by_matchup(source, "Iris vs Alder", 0), NotFoundException);
}

/**
 * Tests for reading the configuration
 */

#include "tests_common.hpp"
#include "configuration.hpp"
#include "error.hpp"
#include <iterator>

namespace
{

template<size_t N>
void read_args(Configuration& configuration, const char* (&argv)[N])
{
	configuration.read_from_args(static_cast<int>(N), argv);
}

}

TEST(ConfigurationTest, Defaults)
{
	const Configuration configuration;

	EXPECT_EQ(std::filesystem::path{"TestOutput"} / "output1.txt", configuration.input_path());
	EXPECT_EQ(std::filesystem::path{"TestOutput"} / "replay.html", configuration.output_path());
	EXPECT_FALSE(configuration.battle_index.has_value());
	EXPECT_FALSE(configuration.matchup.has_value());
	EXPECT_EQ(0, configuration.occurrence);
	EXPECT_FALSE(configuration.list_matchups);
	EXPECT_EQ(80, configuration.top_n);
	EXPECT_EQ(OutputFormat::HTML, configuration.output_format);
	EXPECT_TRUE(configuration.effective_overrides().empty());
}

/**
 * Tests the accepted forms of command-line options.
 */
TEST(ConfigurationTest, Args)
{
	Configuration configuration;
	const char* argv[] = {"battlereel", "--folder=runs", "--input", "run2.txt", "--battle-index", "3",
	                      "--matchup=Alder vs Alder", "--occurrence=1", "--p1_name", "Red",
	                      "--output-format", "json", "--embed-base=https://play.example.org/"};

	read_args(configuration, argv);

	EXPECT_EQ(std::filesystem::path{"runs"} / "run2.txt", configuration.input_path());
	EXPECT_EQ(3, configuration.battle_index.value_or(-1));
	EXPECT_EQ("Alder vs Alder", configuration.matchup.value_or(""));
	EXPECT_EQ(1, configuration.occurrence);
	EXPECT_EQ("Red", configuration.overrides.p1.name.value_or(""));
	EXPECT_EQ(OutputFormat::JSON, configuration.output_format);
	EXPECT_EQ("https://play.example.org/", configuration.embed_base);
}

/**
 * Tests that switches work with and without a value.
 */
TEST(ConfigurationTest, Switch)
{
	Configuration last;
	const char* last_argv[] = {"battlereel", "--top-n", "5", "--list-matchups"};
	read_args(last, last_argv);
	EXPECT_TRUE(last.list_matchups);
	EXPECT_EQ(5, last.top_n);

	Configuration middle;
	const char* middle_argv[] = {"battlereel", "--list-matchups", "--top-n=5"};
	read_args(middle, middle_argv);
	EXPECT_TRUE(middle.list_matchups);

	Configuration valued;
	const char* valued_argv[] = {"battlereel", "--list-matchups", "false"};
	read_args(valued, valued_argv);
	EXPECT_FALSE(valued.list_matchups);
}

TEST(ConfigurationTest, BadArgs)
{
	Configuration configuration;

	const char* unknown[] = {"battlereel", "--speed=3"};
	EXPECT_THROW(read_args(configuration, unknown), ConfigException);

	const char* missing[] = {"battlereel", "--matchup"};
	EXPECT_THROW(read_args(configuration, missing), ConfigException);

	const char* stray[] = {"battlereel", "replay.html"};
	EXPECT_THROW(read_args(configuration, stray), ConfigException);

	const char* not_a_number[] = {"battlereel", "--battle-index=first"};
	EXPECT_THROW(read_args(configuration, not_a_number), ConfigException);

	const char* bad_format[] = {"battlereel", "--output-format=xml"};
	EXPECT_THROW(read_args(configuration, bad_format), ConfigException);
}

/**
 * Tests that negative positions and counts are rejected.
 */
TEST(ConfigurationTest, Negative)
{
	const char* index[] = {"battlereel", "--battle-index=-1"};
	Configuration index_configuration;
	EXPECT_THROW(read_args(index_configuration, index), ConfigException);

	const char* occurrence[] = {"battlereel", "--occurrence=-2"};
	Configuration occurrence_configuration;
	EXPECT_THROW(read_args(occurrence_configuration, occurrence), ConfigException);

	const char* top_n[] = {"battlereel", "--top-n=-80"};
	Configuration top_n_configuration;
	EXPECT_THROW(read_args(top_n_configuration, top_n), ConfigException);
}

/**
 * Tests that the values for both players fill in missing side values.
 */
TEST(ConfigurationTest, EffectiveOverrides)
{
	Configuration configuration;
	const char* argv[] = {"battlereel", "--both-name=Trainer", "--both-avatar=7",
	                      "--p2-name=Rival", "--p1-avatar="};

	read_args(configuration, argv);
	const PlayerOverrides overrides = configuration.effective_overrides();

	EXPECT_EQ("Trainer", overrides.p1.name.value_or(""));
	EXPECT_EQ("7", overrides.p1.avatar.value_or(""));
	EXPECT_EQ("Rival", overrides.p2.name.value_or(""));
	EXPECT_EQ("7", overrides.p2.avatar.value_or(""));
}

TEST(ConfigurationTest, File)
{
	TempDirectory dir{"configuration"};
	const auto path = dir.write_file("battlereel.conf",
		"# replay of the second run\n"
		"folder = runs\n"
		"input=run2.txt\n"
		"matchup = Iris vs Cynthia  \n"
		"list_matchups true\n");

	Configuration configuration;
	configuration.read_from_file(path);

	EXPECT_EQ(std::filesystem::path{"runs"} / "run2.txt", configuration.input_path());
	EXPECT_EQ("Iris vs Cynthia", configuration.matchup.value_or(""));
	EXPECT_TRUE(configuration.list_matchups);
}

TEST(ConfigurationTest, MissingFile)
{
	Configuration configuration;
	EXPECT_THROW(configuration.read_from_file("no/such/battlereel.conf"), ConfigException);
}

/**
 * Tests for replay file output
 */

#include "tests_common.hpp"
#include "writer.hpp"
#include "error.hpp"
#include <sstream>

class WriterTest : public ::testing::Test
{

public:

	explicit WriterTest()
	{
		record.player1 = "Alder";
		record.player2 = "Cynthia & <Co>";
		record.format = "[Gen 9] Custom Game";
		record.timestamp = "Tue Nov 14 2023 22:13:20";
		record.log = {"|player|p1|Alder|1|", "|chat|Alder|</script><b>hi</b>", ""};
		record.input_log = "";
		record.room_id = "simbattle0";
	}

protected:

	ReplayRecord record;

};

/**
 * Tests that the JSON replay contains every field of the record.
 */
TEST_F(WriterTest, Json)
{
	std::stringstream stream;
	JsonReplayWriter writer;
	writer.write(stream, record);

	Json::CharReaderBuilder builder;
	Json::Value json;
	std::string errors;
	ASSERT_TRUE(Json::parseFromStream(builder, stream, &json, &errors)) << errors;

	EXPECT_EQ("Alder", json["p1"].asString());
	EXPECT_EQ("Cynthia & <Co>", json["p2"].asString());
	EXPECT_EQ("[Gen 9] Custom Game", json["format"].asString());
	EXPECT_EQ("Tue Nov 14 2023 22:13:20", json["timestamp"].asString());
	EXPECT_EQ("simbattle0", json["roomid"].asString());
	EXPECT_EQ("", json["inputLog"].asString());

	const Json::Value& log = json["log"];
	ASSERT_TRUE(log.isArray());
	ASSERT_EQ(3u, log.size());
	EXPECT_EQ("|player|p1|Alder|1|", log[0].asString());
	EXPECT_EQ("", log[2].asString());
}

/**
 * Tests that non-ASCII names appear in the JSON as they are.
 */
TEST_F(WriterTest, JsonUtf8)
{
	record.player1 = "Bj\xC3\xB6rn";

	std::ostringstream stream;
	JsonReplayWriter{}.write(stream, record);

	EXPECT_NE(std::string::npos, stream.str().find("\"Bj\xC3\xB6rn\""));
}

/**
 * Tests that the replay page escapes names and cannot be broken by the log.
 */
TEST_F(WriterTest, Html)
{
	std::ostringstream stream;
	HtmlReplayWriter writer{"https://play.example.org"};
	writer.write(stream, record);
	const std::string html = stream.str();

	EXPECT_NE(std::string::npos, html.find(
		"<title>[Gen 9] Custom Game: Alder vs. Cynthia &amp; &lt;Co&gt; - Replay</title>"));
	EXPECT_NE(std::string::npos, html.find("name=\"replayid\" value=\"simbattle0\""));
	EXPECT_NE(std::string::npos, html.find("|chat|Alder|<\\/script><b>hi<\\/b>"));
	EXPECT_EQ(std::string::npos, html.find("</script><b>"));
	EXPECT_NE(std::string::npos, html.find("https://play.example.org/users/cynthiaco"));
	EXPECT_NE(std::string::npos, html.find("https://play.example.org/js/replay-embed.js?version"));
}

/**
 * Tests that trailing slashes of the viewer location are not doubled.
 */
TEST_F(WriterTest, HtmlEmbedBase)
{
	std::ostringstream stream;
	HtmlReplayWriter writer{"https://play.example.org//"};
	writer.write(stream, record);

	EXPECT_NE(std::string::npos, stream.str().find("\"https://play.example.org/js/replay-embed.js"));
	EXPECT_EQ(std::string::npos, stream.str().find(".org//"));
}

TEST(WriterFunctionTest, OutputFormat)
{
	EXPECT_STREQ("html", output_format_to_string(OutputFormat::HTML));
	EXPECT_STREQ("json", output_format_to_string(OutputFormat::JSON));
	EXPECT_EQ(OutputFormat::JSON, string_to_output_format("json"));
	EXPECT_THROW(string_to_output_format("xml"), ConfigException);
	EXPECT_THROW(string_to_output_format("JSON"), ConfigException);
}

TEST(WriterFunctionTest, MakeReplayWriter)
{
	const std::unique_ptr<IReplayWriter> html = make_replay_writer(OutputFormat::HTML, "x");
	const std::unique_ptr<IReplayWriter> json = make_replay_writer(OutputFormat::JSON, "x");

	EXPECT_NE(nullptr, dynamic_cast<HtmlReplayWriter*>(html.get()));
	EXPECT_NE(nullptr, dynamic_cast<JsonReplayWriter*>(json.get()));
}

TEST(WriterFunctionTest, HtmlEscape)
{
	EXPECT_EQ("&lt;a href=&quot;x&quot;&gt;Tom &amp; Jerry&#039;s&lt;/a&gt;",
	          html_escape("<a href=\"x\">Tom & Jerry's</a>"));
	EXPECT_EQ("Alder", html_escape("Alder"));
}

TEST(WriterFunctionTest, UserId)
{
	EXPECT_EQ("drwily2", to_user_id("Dr. Wily 2"));
	EXPECT_EQ("", to_user_id("!!!"));
}

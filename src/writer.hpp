/**
 * Output of replay records for the replay viewer.
 */
#pragma once

#include <string>
#include <memory>
#include <ostream>
#include <json/json.h>
#include "record.hpp"

/**
 * The kinds of file that a replay record can be written to.
 */
enum class OutputFormat
{
	HTML, //!< self-contained replay page that loads the replay viewer
	JSON  //!< replay record as a JSON object
};

/**
 * Return the string representation of the @c OutputFormat.
 */
const char* output_format_to_string(OutputFormat format) noexcept;

/**
 * Return the corresponding @c OutputFormat for the string representation.
 * @throw ConfigException if the string is not recognized.
 */
OutputFormat string_to_output_format(const std::string& format_string);

/**
 * Return the replay record as the JSON object that the replay viewer reads.
 * The keys are "p1", "p2", "log", "inputLog", "roomid", "format" and "timestamp".
 */
Json::Value replay_to_json(const ReplayRecord& record);

/**
 * Writes replay records to a stream.
 */
class IReplayWriter
{

public:

	virtual ~IReplayWriter() =default;
	virtual void write(std::ostream& stream, const ReplayRecord& record) =0;

};

/**
 * Writes the JSON representation of the replay.
 */
class JsonReplayWriter : public IReplayWriter
{

public:

	virtual void write(std::ostream& stream, const ReplayRecord& record) override;

};

/**
 * Writes an HTML page that plays the replay in the browser.
 * The page loads the replay viewer script from @c embed_base.
 */
class HtmlReplayWriter : public IReplayWriter
{

public:

	explicit HtmlReplayWriter(std::string embed_base);

	virtual void write(std::ostream& stream, const ReplayRecord& record) override;

private:

	std::string m_embed_base; //!< viewer location without trailing slash

};

/**
 * Create the writer implementation for the output format.
 */
std::unique_ptr<IReplayWriter> make_replay_writer(OutputFormat format, const std::string& embed_base);

/**
 * Escape the characters that have a meaning in HTML text and attributes.
 */
std::string html_escape(const std::string& text);

/**
 * Return the user id for a player name, as used in viewer links:
 * lowercase letters and digits only.
 */
std::string to_user_id(const std::string& name);

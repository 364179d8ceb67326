#include "writer.hpp"
#include "error.hpp"
#include <algorithm>
#include <iterator>
#include <cassert>
#include <cctype>

namespace
{

const char* output_format_string[] =
{ "html", "json" };

const char* REPLAY_PAGE_STYLE =
	"html,body {font-family:Verdana, sans-serif;font-size:10pt;margin:0;padding:0;}"
	"body{padding:12px 0;}"
	".battle-log {font-family:Verdana, sans-serif;font-size:10pt;}"
	".subtle {color:#3A4A66;}";

/**
 * Return the log as the text content of the viewer's log script element.
 * A closing tag inside the log would end the element early.
 */
std::string script_text(const std::vector<std::string>& log);

}

const char* output_format_to_string(OutputFormat format) noexcept
{
	const size_t format_index = static_cast<size_t>(format);
	assert(format_index < std::size(output_format_string));
	return output_format_string[format_index];
}

OutputFormat string_to_output_format(const std::string& format_string)
{
	const auto format_found = std::find(output_format_string, std::end(output_format_string), format_string);
	const size_t format_index = std::distance(output_format_string, format_found);

	if(std::size(output_format_string) <= format_index)
		throwx<ConfigException>("Invalid output format: \"%s\"", format_string.c_str());

	return static_cast<OutputFormat>(format_index);
}

Json::Value replay_to_json(const ReplayRecord& record)
{
	Json::Value json(Json::objectValue);
	json["p1"] = record.player1;
	json["p2"] = record.player2;

	Json::Value log(Json::arrayValue);
	for(const std::string& line : record.log)
		log.append(line);

	json["log"] = log;
	json["inputLog"] = record.input_log;
	json["roomid"] = record.room_id;
	json["format"] = record.format;
	json["timestamp"] = record.timestamp;
	return json;
}

void JsonReplayWriter::write(std::ostream& stream, const ReplayRecord& record)
{
	Json::StreamWriterBuilder builder;
	builder["indentation"] = "\t";
	builder["emitUTF8"] = true;

	stream << Json::writeString(builder, replay_to_json(record)) << "\n";

	if(!stream)
		throwx<ReelException>("Failed to write replay \"%s\".", record.room_id.c_str());
}

HtmlReplayWriter::HtmlReplayWriter(std::string embed_base)
: m_embed_base(std::move(embed_base))
{
	while(!m_embed_base.empty() && '/' == m_embed_base.back())
		m_embed_base.pop_back();
}

void HtmlReplayWriter::write(std::ostream& stream, const ReplayRecord& record)
{
	const std::string format = html_escape(record.format);
	const std::string p1 = html_escape(record.player1);
	const std::string p2 = html_escape(record.player2);

	stream << "<!DOCTYPE html>\n"
	       << "<meta charset=\"utf-8\" />\n"
	       << "<!-- version 1 -->\n"
	       << "<title>" << format << ": " << p1 << " vs. " << p2 << " - Replay</title>\n"
	       << "<style>\n" << REPLAY_PAGE_STYLE << "\n</style>\n"
	       << "<div class=\"wrapper replay-wrapper\" style=\"max-width:1180px;margin:0 auto\">\n"
	       << "<input type=\"hidden\" name=\"replayid\" value=\"" << html_escape(record.room_id) << "\" />\n"
	       << "<div class=\"battle\"></div><div class=\"battle-log\"></div>"
	       << "<div class=\"replay-controls\"></div><div class=\"replay-controls-2\"></div>\n"
	       << "<h1 style=\"font-weight:normal;text-align:center\"><strong>" << format << "</strong><br />"
	       << "<a href=\"" << m_embed_base << "/users/" << to_user_id(record.player1)
	       << "\" class=\"subtle\" target=\"_blank\">" << p1 << "</a> vs. "
	       << "<a href=\"" << m_embed_base << "/users/" << to_user_id(record.player2)
	       << "\" class=\"subtle\" target=\"_blank\">" << p2 << "</a></h1>\n"
	       << "<script type=\"text/plain\" class=\"battle-log-data\">" << script_text(record.log) << "</script>\n"
	       << "</div>\n"
	       << "<script>\n"
	       << "let daily = Math.floor(Date.now()/1000/60/60/24);"
	       << "document.write('<script src=\"" << m_embed_base << "/js/replay-embed.js?version'+daily+'\"></'+'script>');\n"
	       << "</script>\n";

	if(!stream)
		throwx<ReelException>("Failed to write replay \"%s\".", record.room_id.c_str());
}

std::unique_ptr<IReplayWriter> make_replay_writer(OutputFormat format, const std::string& embed_base)
{
	switch(format) {
		case OutputFormat::HTML: return std::make_unique<HtmlReplayWriter>(embed_base);
		case OutputFormat::JSON: return std::make_unique<JsonReplayWriter>();
	}

	throwx<ReelException>("Unknown output format %d.", static_cast<int>(format));
}

std::string html_escape(const std::string& text)
{
	std::string result;
	result.reserve(text.size());

	for(char c : text) {
		switch(c) {
			case '&': result += "&amp;"; break;
			case '<': result += "&lt;"; break;
			case '>': result += "&gt;"; break;
			case '"': result += "&quot;"; break;
			case '\'': result += "&#039;"; break;
			default: result += c; break;
		}
	}

	return result;
}

std::string to_user_id(const std::string& name)
{
	std::string id;

	for(char c : to_lower(name)) {
		if(std::isdigit(static_cast<unsigned char>(c)) || (c >= 'a' && c <= 'z'))
			id += c;
	}

	return id;
}

namespace
{

std::string script_text(const std::vector<std::string>& log)
{
	std::string text = join(log, '\n');
	size_t pos = 0;

	while(std::string::npos != (pos = text.find("</", pos))) {
		text.replace(pos, 2, "<\\/");
		pos += 3;
	}

	return text;
}

}

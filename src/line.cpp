/**
 * Definitions for line classification.
 */

#include "line.hpp"
#include "error.hpp"

bool is_start_marker(const std::string& line)
{
	return START_MARKER == trim(line);
}

bool is_end_marker(const std::string& line)
{
	return END_MARKER == trim(line);
}

bool is_protocol_line(const std::string& line) noexcept
{
	return !line.empty() && PROTOCOL_SIGIL == line[0];
}

bool read_line(std::istream& stream, std::string& line)
{
	if(!std::getline(stream, line)) {
		if(stream.bad())
			throwx<InputException>("Failed to read from battle log.");

		return false;
	}

	if(!line.empty() && '\r' == line.back())
		line.pop_back();

	replace_invalid_utf8(line);
	return true;
}

namespace
{

const char REPLACEMENT_CHARACTER[] = "\xEF\xBF\xBD"; // U+FFFD

bool is_continuation(unsigned char byte) noexcept
{
	return 0x80 == (byte & 0xC0);
}

/**
 * Return the length of the valid UTF-8 sequence starting at @c pos,
 * or 0 if the bytes at @c pos do not form one.
 */
size_t utf8_sequence_length(const std::string& text, size_t pos) noexcept
{
	const unsigned char lead = static_cast<unsigned char>(text[pos]);
	size_t length;
	unsigned char min_second = 0x80;
	unsigned char max_second = 0xBF;

	if(lead < 0x80) return 1;
	else if(lead >= 0xC2 && lead <= 0xDF) length = 2;
	else if(lead >= 0xE0 && lead <= 0xEF) {
		length = 3;
		if(0xE0 == lead) min_second = 0xA0; // overlong
		if(0xED == lead) max_second = 0x9F; // surrogates
	}
	else if(lead >= 0xF0 && lead <= 0xF4) {
		length = 4;
		if(0xF0 == lead) min_second = 0x90; // overlong
		if(0xF4 == lead) max_second = 0x8F; // beyond U+10FFFF
	}
	else return 0;

	if(pos + length > text.size())
		return 0;

	const unsigned char second = static_cast<unsigned char>(text[pos + 1]);
	if(second < min_second || second > max_second)
		return 0;

	for(size_t i = 2; i < length; i++)
		if(!is_continuation(static_cast<unsigned char>(text[pos + i])))
			return 0;

	return length;
}

}

void replace_invalid_utf8(std::string& text)
{
	size_t pos = 0;

	// fast path: most logs are plain ASCII
	while(pos < text.size() && static_cast<unsigned char>(text[pos]) < 0x80)
		pos++;

	if(pos == text.size())
		return;

	std::string result = text.substr(0, pos);

	while(pos < text.size()) {
		const size_t length = utf8_sequence_length(text, pos);

		if(0 == length) {
			result += REPLACEMENT_CHARACTER;
			pos++;
		}
		else {
			result.append(text, pos, length);
			pos += length;
		}
	}

	text = std::move(result);
}

bool is_record(const std::string& line, const char* type)
{
	const std::string prefix = std::string(1, PROTOCOL_SIGIL) + type;

	if(0 != line.compare(0, prefix.size(), prefix))
		return false;

	return line.size() == prefix.size() || PROTOCOL_SIGIL == line[prefix.size()];
}

bool is_player_record(const std::string& line, Side side)
{
	const std::string prefix = string_format("|%s|%s|", record::PLAYER, side_to_string(side));
	return 0 == line.compare(0, prefix.size(), prefix);
}

std::string record_field(const std::string& line, size_t index)
{
	const std::vector<std::string> fields = split(line, PROTOCOL_SIGIL);
	return index < fields.size() ? fields[index] : std::string{};
}

/**
 * Definitions for battle block segmentation.
 */

#include "battle.hpp"
#include "line.hpp"
#include "globals.hpp"
#include "error.hpp"
#include <fstream>
#include <sstream>
#include <cassert>

FileBattleSource::FileBattleSource(std::filesystem::path path)
: m_path(std::move(path))
{
}

std::unique_ptr<std::istream> FileBattleSource::open() const
{
	auto stream = std::make_unique<std::ifstream>(m_path, std::ios_base::in | std::ios_base::binary);

	if(!stream->is_open())
		throwx<InputException>("Failed to open battle log: %s", m_path.string().c_str());

	return stream;
}

std::unique_ptr<std::istream> TextBattleSource::open() const
{
	return std::make_unique<std::istringstream>(m_text);
}

const char* segment_mode_to_string(SegmentMode mode) noexcept
{
	switch(mode) {
		case SegmentMode::MARKED: return "marked";
		case SegmentMode::FALLBACK: return "fallback";
		default: assert(false); return nullptr;
	}
}

SegmentMode detect_segment_mode(std::istream& stream)
{
	bool has_start = false;
	bool has_end = false;
	std::string line;

	// markers never span lines, so searching line by line finds
	// exactly what a search through the whole text would
	while(!(has_start && has_end) && read_line(stream, line)) {
		has_start = has_start || std::string::npos != line.find(START_MARKER);
		has_end = has_end || std::string::npos != line.find(END_MARKER);
	}

	return has_start && has_end ? SegmentMode::MARKED : SegmentMode::FALLBACK;
}

BattleReader::BattleReader(const IBattleSource& source)
: m_stream(),
  m_mode(SegmentMode::FALLBACK),
  m_finished(false),
  m_in_block(false),
  m_awaiting_header(false),
  m_header(),
  m_lines()
{
	{
		std::unique_ptr<std::istream> scan = source.open();
		m_mode = detect_segment_mode(*scan);
	}

	Log::info("Read battles from %s in %s mode.", source.name().c_str(), segment_mode_to_string(m_mode));
	m_stream = source.open();
}

std::optional<BattleBlock> BattleReader::next()
{
	if(m_finished)
		return {};

	switch(m_mode) {
		case SegmentMode::MARKED: return next_marked();
		case SegmentMode::FALLBACK: m_finished = true; return read_fallback();
		default: assert(false); return {};
	}
}

std::optional<BattleBlock> BattleReader::next_marked()
{
	std::string line;

	while(read_line(*m_stream, line)) {
		if(!m_in_block) {
			if(is_start_marker(line)) {
				m_in_block = true;
				m_awaiting_header = true;
				m_header.reset();
				m_lines.clear();
			}
			continue;
		}

		if(is_end_marker(line)) {
			BattleBlock block{m_header.value_or(UNKNOWN_MATCHUP), std::move(m_lines)};
			m_in_block = false;
			m_awaiting_header = false;
			m_header.reset();
			m_lines.clear();
			return block;
		}

		if(m_awaiting_header) {
			std::string header = trim(line);
			if(!header.empty()) {
				m_header = std::move(header);
				m_awaiting_header = false;
			}
			continue;
		}

		if(is_protocol_line(line))
			m_lines.push_back(line);
	}

	if(m_in_block)
		Log::info("Drop unterminated battle \"%s\" with %zu protocol lines at end of log.",
		          m_header.value_or(UNKNOWN_MATCHUP).c_str(), m_lines.size());

	m_finished = true;
	return {};
}

BattleBlock BattleReader::read_fallback()
{
	std::optional<std::string> header;
	std::vector<std::string> lines;
	std::string line;

	while(read_line(*m_stream, line)) {
		if(trim(line).empty())
			continue;

		if(is_protocol_line(line))
			lines.push_back(line);
		else if(!header)
			header = trim(line);
	}

	return BattleBlock{header.value_or(UNKNOWN_MATCHUP), std::move(lines)};
}

size_t count_completed_battles(std::istream& stream)
{
	size_t count = 0;
	std::string line;

	while(std::getline(stream, line)) {
		// the last line only counts if it was terminated
		if(stream.eof())
			break;

		if(!line.empty() && '\r' == line.back())
			line.pop_back();

		const size_t marker_length = std::char_traits<char>::length(END_MARKER);
		if(line.size() >= marker_length && 0 == line.compare(line.size() - marker_length, marker_length, END_MARKER))
			count++;
	}

	if(stream.bad())
		throwx<InputException>("Failed to read from battle log.");

	return count;
}

/**
 * This module splits a battle log into battle blocks.
 *
 * A battle log is the text output of repeated simulation runs.
 * Normally, every battle in it is wrapped in markers:
 *
 *     [[[[[
 *     Alder vs Cynthia
 *     |player|p1|Alder|1|
 *     ...
 *     ]]]]]
 *
 * The first non-empty line after the start marker is the matchup header.
 * Of the following lines, only protocol lines belong to the battle.
 * Everything between blocks is ignored. A block that is still open at
 * the end of the input is dropped.
 *
 * If the log does not contain both markers, it is read as one single battle
 * (fallback mode). Deciding the mode takes a separate pass over the input
 * before the battles are read, so every source is read twice.
 */
#pragma once

#include <string>
#include <vector>
#include <optional>
#include <memory>
#include <istream>
#include <filesystem>

/**
 * One match transcript from the battle log.
 */
struct BattleBlock
{
	std::string header; //!< matchup label, e.g. "Alder vs Cynthia"
	std::vector<std::string> protocol_lines; //!< all protocol lines in original order
};

/**
 * A battle log that can be read from the start any number of times.
 */
class IBattleSource
{

public:

	virtual ~IBattleSource() =default;

	/**
	 * Return a new stream positioned at the start of the log.
	 */
	virtual std::unique_ptr<std::istream> open() const =0;

	/**
	 * Return a description of the source for messages.
	 */
	virtual std::string name() const =0;

};

/**
 * Battle log stored in a file.
 */
class FileBattleSource : public IBattleSource
{

public:

	explicit FileBattleSource(std::filesystem::path path);

	/**
	 * @throw InputException if the file cannot be opened.
	 */
	virtual std::unique_ptr<std::istream> open() const override;
	virtual std::string name() const override { return m_path.string(); }

private:

	std::filesystem::path m_path;

};

/**
 * Battle log held in memory.
 */
class TextBattleSource : public IBattleSource
{

public:

	explicit TextBattleSource(std::string text) : m_text(std::move(text)) {}

	virtual std::unique_ptr<std::istream> open() const override;
	virtual std::string name() const override { return "<text>"; }

private:

	std::string m_text;

};

/**
 * The two ways of reading a battle log.
 */
enum class SegmentMode
{
	MARKED,  //!< battles are delimited by start and end markers
	FALLBACK //!< the whole log is one battle
};

/**
 * Return the string representation of the @c SegmentMode.
 */
const char* segment_mode_to_string(SegmentMode mode) noexcept;

/**
 * Scan the entire stream for the start and end markers.
 * If both occur anywhere in the text, the log is in @c MARKED mode.
 */
SegmentMode detect_segment_mode(std::istream& stream);

/**
 * Reads the battle blocks from a source, one at a time.
 *
 * The reader is a one-shot, forward-only producer. To read the battles
 * again, construct a new reader on the same source.
 */
class BattleReader
{

public:

	/**
	 * Detect the mode of the source and open it for reading battles.
	 * The source must outlive the constructor call only.
	 */
	explicit BattleReader(const IBattleSource& source);

	SegmentMode mode() const noexcept { return m_mode; }

	/**
	 * Return the next battle block from the log.
	 * If there are no more blocks, return an empty optional.
	 */
	std::optional<BattleBlock> next();

private:

	std::unique_ptr<std::istream> m_stream;
	SegmentMode m_mode;
	bool m_finished; //!< true when the stream holds no more blocks

	// marked mode state
	bool m_in_block;
	bool m_awaiting_header;
	std::optional<std::string> m_header;
	std::vector<std::string> m_lines;

	std::optional<BattleBlock> next_marked();
	BattleBlock read_fallback();

};

/**
 * Count the battles that a simulation run has completed, i.e. the number
 * of end markers that are followed by a line break.
 */
size_t count_completed_battles(std::istream& stream);

/**
 * Classification of single lines in a battle log.
 *
 * A battle log is mostly free text. Only three shapes of line carry meaning:
 * the start and end markers around a battle block, which must stand alone
 * on their line (surrounding whitespace is ignored), and protocol lines,
 * which start with the protocol sigil '|' and hold pipe-delimited fields.
 *
 * Protocol lines of a few record types are recognized by their prefix:
 *
 *     |player|p1|Name|Avatar|
 *     |tier|Format Name
 *     |t:|1700000000
 *     |start
 */
#pragma once

#include <string>
#include <istream>
#include "globals.hpp"

/**
 * Return true if the line, after trimming, is exactly the start marker.
 */
bool is_start_marker(const std::string& line);

/**
 * Return true if the line, after trimming, is exactly the end marker.
 */
bool is_end_marker(const std::string& line);

/**
 * Return true if the line starts with the protocol sigil.
 * Leading whitespace disqualifies the line.
 */
bool is_protocol_line(const std::string& line) noexcept;

/**
 * Read the next line from the stream into @c line.
 * The line terminator ("\n" or "\r\n") is not part of the result and
 * invalid UTF-8 sequences are replaced.
 * @return false at the end of the stream.
 * @throw InputException if the stream fails for any other reason.
 */
bool read_line(std::istream& stream, std::string& line);

/**
 * Replace every byte sequence that is not valid UTF-8 with U+FFFD.
 */
void replace_invalid_utf8(std::string& text);

// ================================================
// Protocol records
// ================================================

/**
 * Record type names as they appear in the second field of a protocol line.
 */
namespace record
{
constexpr const char* PLAYER = "player";
constexpr const char* TIER = "tier";
constexpr const char* TIME = "t:";
constexpr const char* START = "start";
}

// field positions in a split player record: "", "player", side, name, avatar
constexpr size_t PLAYER_SIDE_FIELD = 2;
constexpr size_t PLAYER_NAME_FIELD = 3;
constexpr size_t PLAYER_AVATAR_FIELD = 4;
constexpr size_t PLAYER_MIN_FIELDS = 6; //!< a complete player record ends with a '|'

// field position of the value in "|tier|..." and "|t:|..."
constexpr size_t RECORD_VALUE_FIELD = 2;

/**
 * Return true if the line is a protocol record of the given type,
 * i.e. is exactly "|type" or starts with "|type|".
 */
bool is_record(const std::string& line, const char* type);

/**
 * Return true if the line is the player record of the given side,
 * i.e. starts with "|player|p1|" or "|player|p2|".
 */
bool is_player_record(const std::string& line, Side side);

/**
 * Return the pipe-delimited field at the given position of the line.
 * The empty string before the leading sigil is field 0.
 * If the line has fewer fields, return the empty string.
 */
std::string record_field(const std::string& line, size_t index);

/**
 * globals.hpp
 * General global definitions without dependencies.
 * Every other header may include this header.
 */

#pragma once

#include <vector>
#include <string>
#include <memory>
#include <cstdio>

// ================================================
// Application constants
// ================================================

constexpr const char* APP_NAME = "battlereel";

// Battle log syntax
constexpr const char* START_MARKER = "[[[[["; //!< opens a battle block on its own line
constexpr const char* END_MARKER = "]]]]]"; //!< closes a battle block on its own line
constexpr char PROTOCOL_SIGIL = '|'; //!< first character of every protocol line
constexpr const char* UNKNOWN_MATCHUP = "UNKNOWN_MATCHUP"; //!< header of a block without one

// Replay record defaults
constexpr const char* DEFAULT_FORMAT = "Custom Game"; //!< format if the log has no tier line
constexpr const char* DEFAULT_AVATAR = "1"; //!< avatar of a synthesized player line
constexpr const char* DEFAULT_ROOM_ID = "sim"; //!< room id if sanitizing leaves nothing
constexpr size_t MAX_ROOM_ID_LENGTH = 64;
constexpr const char* TIMESTAMP_FORMAT = "%s %s %02d %04d %02d:%02d:%02d"; //!< e.g. "Tue Nov 14 2023 22:13:20"

// Command-line defaults
constexpr const char* DEFAULT_FOLDER = "TestOutput";
constexpr const char* DEFAULT_INPUT = "output1.txt";
constexpr const char* DEFAULT_OUTPUT = "replay.html";
constexpr const char* DEFAULT_EMBED_BASE = "https://play.pokemonshowdown.com";
constexpr int DEFAULT_TOP_N = 80; //!< number of matchups to list

// ================================================
// Enumeration types and conversions
// ================================================

/**
 * The two sides of a battle.
 */
enum class Side { P1, P2 };

/**
 * Return the protocol token of the @c Side ("p1" or "p2").
 */
const char* side_to_string(Side side) noexcept;

// ================================================
// String utilities
// ================================================

/**
 * Return the string without leading and trailing whitespace.
 */
std::string trim(const std::string& str);

/**
 * Return the string with all ASCII letters in lower case.
 */
std::string to_lower(std::string str);

/**
 * Split the string at every occurrence of the delimiter.
 * Empty fields are preserved, so "|a||b" yields {"", "a", "", "b"}.
 */
std::vector<std::string> split(const std::string& str, char delimiter);

/**
 * Concatenate the fields with the delimiter between each of them.
 * This is the inverse of @c split.
 */
std::string join(const std::vector<std::string>& fields, char delimiter);

// ================================================
// Miscellaneous
// ================================================

// https://stackoverflow.com/questions/2342162/stdstring-formatting-like-sprintf
template<typename... Args>
std::string string_format(const std::string& format, Args... args)
{
	int size = std::snprintf(nullptr, 0, format.c_str(), args...) + 1; // Extra space for '\0'
	std::unique_ptr<char[]> buf(new char[size]);
	snprintf(buf.get(), size, format.c_str(), args...);
	return std::string(buf.get(), buf.get() + size - 1); // We don't want the '\0' inside
}

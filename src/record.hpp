/**
 * Extraction of replay metadata from protocol lines.
 *
 * The replay record is what the replay writers need to present one battle:
 * the names of both players, the battle format, a timestamp and the
 * complete protocol log.
 */
#pragma once

#include <string>
#include <vector>
#include <ctime>
#include "globals.hpp"

/**
 * Structured description of one battle for the replay viewer.
 */
struct ReplayRecord
{
	std::string player1;   //!< name of the p1 player, "p1" if unknown
	std::string player2;   //!< name of the p2 player, "p2" if unknown
	std::string format;    //!< battle format from the tier line
	std::string timestamp; //!< battle time, e.g. "Tue Nov 14 2023 22:13:20" (UTC)
	std::vector<std::string> log; //!< protocol lines and one trailing empty line
	std::string input_log; //!< always empty; the simulation does not record inputs
	std::string room_id;   //!< lowercase alphanumeric identifier of the replay
};

/**
 * Build the replay record from the (rewritten) protocol lines of a battle.
 *
 * Player names and format come from the first matching record line.
 * The timestamp comes from the first "t:" line with a valid epoch time;
 * if there is none, @c now is used instead.
 * The room id is sanitized from @c room_key (see @c sanitize_room_id).
 */
ReplayRecord build_replay_record(const std::vector<std::string>& protocol_lines,
                                 const std::string& room_key,
                                 const std::string& room_fallback,
                                 std::time_t now);

/**
 * Build the replay record with the current time as fallback timestamp.
 */
ReplayRecord build_replay_record(const std::vector<std::string>& protocol_lines,
                                 const std::string& room_key,
                                 const std::string& room_fallback = DEFAULT_ROOM_ID);

/**
 * Reduce the key to lowercase letters and digits and cut it to 64 characters.
 * If nothing remains, use the fallback instead.
 */
std::string sanitize_room_id(const std::string& key, const std::string& fallback = DEFAULT_ROOM_ID);

/**
 * Return the room key for the battle selected by index, e.g. "sim-battle-3".
 */
std::string index_room_key(size_t index);

/**
 * Return the room key for the battle selected by matchup, e.g. "Alder vs Alder-1".
 */
std::string matchup_room_key(const std::string& matchup, int occurrence);

/**
 * Parse the value of a "t:" line as seconds since the epoch.
 * @throw TimestampException if the value is not an integer.
 */
std::time_t parse_epoch(const std::string& value);

/**
 * Format the epoch time in UTC as "Www Mmm dd yyyy hh:mm:ss".
 * The output does not depend on the process locale.
 * @throw TimestampException if the time cannot be represented or its year
 *        is outside of 1 to 9999.
 */
std::string format_timestamp(std::time_t epoch);

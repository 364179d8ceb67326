/**
 * Replacement of player identities in protocol lines.
 */
#pragma once

#include <string>
#include <vector>
#include <optional>
#include "globals.hpp"

/**
 * Replacement values for one side's player record.
 * Unset values leave the existing field untouched.
 */
struct PlayerOverride
{
	std::optional<std::string> name;
	std::optional<std::string> avatar; //!< avatar id, passed through verbatim

	bool empty() const noexcept { return !name && !avatar; }
};

/**
 * Replacement values for both sides.
 */
struct PlayerOverrides
{
	PlayerOverride p1;
	PlayerOverride p2;

	const PlayerOverride& side(Side s) const noexcept { return Side::P1 == s ? p1 : p2; }
	bool empty() const noexcept { return p1.empty() && p2.empty(); }
};

/**
 * Apply the overrides to the player records in the protocol lines and
 * return the result. The input is not modified.
 *
 * Existing "|player|pN|" lines have their name and avatar fields replaced.
 * If a side has no player line and an override is given for it, a new
 * player line is inserted before the first "|start" line, or at the
 * beginning if there is none. Missing values in a new line default to
 * the side token as name and to avatar "1".
 */
std::vector<std::string> override_players(const std::vector<std::string>& protocol_lines,
                                          const PlayerOverrides& overrides);

/**
 * Return the player record line with the name and avatar fields replaced
 * by the given values, where present.
 */
std::string override_player_line(const std::string& line, const PlayerOverride& values);

/**
 * Return a new player record line for the side from the override values.
 */
std::string make_player_line(Side side, const PlayerOverride& values);

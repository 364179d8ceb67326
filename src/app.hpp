/**
 * The conversion of one battle from a battle log into a replay file,
 * as configured from the command line.
 */
#pragma once

#include <string>
#include <ostream>
#include "battle.hpp"
#include "record.hpp"
#include "rewrite.hpp"

class Configuration;

/**
 * A battle picked from the log, and the key that names its replay room.
 */
struct Selection
{
	BattleBlock block;
	std::string room_key;
};

/**
 * Pick the battle from the source by matchup, if configured, or else by index.
 * @throw OutOfRangeException, NotFoundException if the battle does not exist.
 */
Selection select_battle(const IBattleSource& source, const Configuration& configuration);

/**
 * Apply the player overrides to the selected battle and build its replay record.
 */
ReplayRecord make_replay(const Selection& selection, const PlayerOverrides& overrides);

/**
 * Execute the configured command: list the matchups in the battle log or
 * convert one battle into a replay file. Report progress to @c out.
 * @throw InputException if the battle log does not exist.
 */
void run(const Configuration& configuration, std::ostream& out);

/**
 * Selection of single battles from a battle log, and statistics
 * about the matchups it contains.
 */
#pragma once

#include <string>
#include <vector>
#include <ostream>
#include "battle.hpp"

/**
 * Number of battles in the log with one particular header.
 */
struct MatchupCount
{
	std::string header;
	size_t count;
};

/**
 * Counts the battles in a log by matchup header.
 * Headers are compared exactly as they appear in the log.
 */
class MatchupIndex
{

public:

	/**
	 * Consume all remaining battles from the reader and count them.
	 */
	static MatchupIndex build(BattleReader& reader);

	/**
	 * Add one battle with the given header to the counts.
	 */
	void add(const std::string& header);

	size_t total() const noexcept { return m_total; }
	size_t unique() const noexcept { return m_counts.size(); }

	/**
	 * Return the number of battles with the given header.
	 */
	size_t count(const std::string& header) const noexcept;

	/**
	 * Return the @c top_n most frequent matchups, most frequent first.
	 * Matchups with equal counts are listed in the order of their first battle.
	 */
	std::vector<MatchupCount> top(size_t top_n) const;

private:

	std::vector<MatchupCount> m_counts; //!< in the order of first appearance
	size_t m_total = 0;

};

/**
 * Print a summary of the most frequent matchups to the stream.
 */
void print_matchups(std::ostream& stream, const MatchupIndex& index, size_t top_n);

/**
 * Return the battle at the 0-based position in the log.
 * @throw OutOfRangeException if the log contains fewer battles.
 */
BattleBlock select_by_index(const IBattleSource& source, size_t index);

/**
 * Return the battle that is the 0-based @c occurrence among all battles
 * with the given matchup header. Headers are compared without regard
 * to case and surrounding whitespace.
 * @throw NotFoundException if there are not enough such battles.
 */
BattleBlock select_by_matchup(const IBattleSource& source, const std::string& matchup, int occurrence);

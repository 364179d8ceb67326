#include "matchup.hpp"
#include "globals.hpp"
#include "error.hpp"
#include <algorithm>

MatchupIndex MatchupIndex::build(BattleReader& reader)
{
	MatchupIndex index;

	while(std::optional<BattleBlock> block = reader.next())
		index.add(block->header);

	Log::info("Indexed %zu battles with %zu unique matchups.", index.total(), index.unique());
	return index;
}

void MatchupIndex::add(const std::string& header)
{
	auto has_header = [&header](const MatchupCount& mc) { return mc.header == header; };
	const auto found = std::find_if(m_counts.begin(), m_counts.end(), has_header);

	if(m_counts.end() == found)
		m_counts.push_back(MatchupCount{header, 1});
	else
		found->count++;

	m_total++;
}

size_t MatchupIndex::count(const std::string& header) const noexcept
{
	auto has_header = [&header](const MatchupCount& mc) { return mc.header == header; };
	const auto found = std::find_if(m_counts.begin(), m_counts.end(), has_header);
	return m_counts.end() == found ? 0 : found->count;
}

std::vector<MatchupCount> MatchupIndex::top(size_t top_n) const
{
	std::vector<MatchupCount> result = m_counts;

	auto more_frequent = [](const MatchupCount& lhs, const MatchupCount& rhs) { return lhs.count > rhs.count; };
	std::stable_sort(result.begin(), result.end(), more_frequent);

	if(result.size() > top_n)
		result.resize(top_n);

	return result;
}

void print_matchups(std::ostream& stream, const MatchupIndex& index, size_t top_n)
{
	if(0 == index.total()) {
		stream << "No battles found.\n";
		return;
	}

	stream << string_format("Found %zu battle(s) across %zu unique matchup header(s):\n",
	                        index.total(), index.unique());

	for(const MatchupCount& mc : index.top(top_n))
		stream << string_format("%5zu  %s\n", mc.count, mc.header.c_str());
}

BattleBlock select_by_index(const IBattleSource& source, size_t index)
{
	BattleReader reader{source};
	size_t position = 0;

	while(std::optional<BattleBlock> block = reader.next()) {
		if(position == index) {
			Log::info("Selected battle %zu: \"%s\".", index, block->header.c_str());
			return std::move(*block);
		}

		position++;
	}

	throwx<OutOfRangeException>(index, position);
}

BattleBlock select_by_matchup(const IBattleSource& source, const std::string& matchup, int occurrence)
{
	enforce(occurrence >= 0);

	const std::string target = to_lower(trim(matchup));
	BattleReader reader{source};
	int hits = 0;

	while(std::optional<BattleBlock> block = reader.next()) {
		if(to_lower(trim(block->header)) != target)
			continue;

		if(hits == occurrence) {
			Log::info("Selected battle \"%s\", occurrence %d.", block->header.c_str(), occurrence);
			return std::move(*block);
		}

		hits++;
	}

	throwx<NotFoundException>(matchup, occurrence);
}

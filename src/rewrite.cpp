#include "rewrite.hpp"
#include "line.hpp"
#include "error.hpp"
#include <algorithm>
#include <array>

std::vector<std::string> override_players(const std::vector<std::string>& protocol_lines,
                                          const PlayerOverrides& overrides)
{
	std::vector<std::string> result = protocol_lines;
	std::array<bool, 2> found{false, false};

	for(std::string& line : result) {
		for(Side side : {Side::P1, Side::P2}) {
			if(is_player_record(line, side)) {
				if(!overrides.side(side).empty())
					line = override_player_line(line, overrides.side(side));
				found[static_cast<size_t>(side)] = true;
				break;
			}
		}
	}

	auto is_start = [](const std::string& line) { return is_record(line, record::START); };
	const auto start = std::find_if(result.begin(), result.end(), is_start);
	const auto insert_index = start == result.end() ? 0 : std::distance(result.begin(), start);

	// both lines go to the same index, so p2 ends up before p1
	for(Side side : {Side::P1, Side::P2}) {
		const PlayerOverride& values = overrides.side(side);

		if(!found[static_cast<size_t>(side)] && !values.empty()) {
			std::string line = make_player_line(side, values);
			Log::trace("Insert player line at %zu: %s", static_cast<size_t>(insert_index), line.c_str());
			result.insert(result.begin() + insert_index, std::move(line));
		}
	}

	return result;
}

std::string override_player_line(const std::string& line, const PlayerOverride& values)
{
	std::vector<std::string> fields = split(line, PROTOCOL_SIGIL);

	if(fields.size() < PLAYER_MIN_FIELDS)
		fields.resize(PLAYER_MIN_FIELDS);

	if(values.name)
		fields[PLAYER_NAME_FIELD] = *values.name;
	if(values.avatar)
		fields[PLAYER_AVATAR_FIELD] = *values.avatar;

	return join(fields, PROTOCOL_SIGIL);
}

std::string make_player_line(Side side, const PlayerOverride& values)
{
	// an empty value counts as missing
	const std::string name = values.name.value_or("").empty() ? side_to_string(side) : *values.name;
	const std::string avatar = values.avatar.value_or("").empty() ? DEFAULT_AVATAR : *values.avatar;

	return string_format("|%s|%s|%s|%s|", record::PLAYER, side_to_string(side), name.c_str(), avatar.c_str());
}

#include "app.hpp"
#include "configuration.hpp"
#include "matchup.hpp"
#include "writer.hpp"
#include "error.hpp"
#include <fstream>

namespace
{

/**
 * Return the text for an override value in the summary.
 */
const char* describe(const std::optional<std::string>& value) noexcept
{
	return value ? value->c_str() : "None";
}

/**
 * Make sure that the directory exists.
 * @throw ReelException if the directory cannot be created.
 */
void create_folder(const std::filesystem::path& path)
{
	try {
		std::filesystem::create_directories(path);
	}
	catch(const std::filesystem::filesystem_error& ex) {
		throwx<ReelException>(ReelException("%s", ex.what()), "Failed to create folder: %s", path.string().c_str());
	}
}

}

Selection select_battle(const IBattleSource& source, const Configuration& configuration)
{
	if(configuration.matchup) {
		const std::string& matchup = *configuration.matchup;
		const int occurrence = configuration.occurrence;
		return Selection{select_by_matchup(source, matchup, occurrence), matchup_room_key(matchup, occurrence)};
	}
	else {
		const size_t index = static_cast<size_t>(configuration.battle_index.value_or(0));
		return Selection{select_by_index(source, index), index_room_key(index)};
	}
}

ReplayRecord make_replay(const Selection& selection, const PlayerOverrides& overrides)
{
	const std::vector<std::string> protocol = override_players(selection.block.protocol_lines, overrides);
	return build_replay_record(protocol, selection.room_key, DEFAULT_ROOM_ID);
}

void run(const Configuration& configuration, std::ostream& out)
{
	const std::filesystem::path input_path = configuration.input_path();
	const std::filesystem::path output_path = configuration.output_path();

	if(!std::filesystem::exists(input_path))
		throwx<InputException>("Input not found: %s", input_path.string().c_str());

	FileBattleSource source{input_path};

	if(configuration.list_matchups) {
		BattleReader reader{source};
		const MatchupIndex index = MatchupIndex::build(reader);
		print_matchups(out, index, static_cast<size_t>(configuration.top_n));
		return;
	}

	const Selection selection = select_battle(source, configuration);
	const PlayerOverrides overrides = configuration.effective_overrides();
	const ReplayRecord record = make_replay(selection, overrides);

	if(output_path.has_parent_path())
		create_folder(output_path.parent_path());

	std::ofstream stream{output_path, std::ios_base::out | std::ios_base::binary};
	if(!stream.is_open())
		throwx<ReelException>("Failed to open replay file: %s", output_path.string().c_str());

	std::unique_ptr<IReplayWriter> writer = make_replay_writer(configuration.output_format, configuration.embed_base);
	writer->write(stream, record);
	Log::info("Wrote %s replay to %s.", output_format_to_string(configuration.output_format), output_path.string().c_str());

	out << "Wrote: " << output_path.string() << "\n";
	out << "Selected battle header: " << selection.block.header << "\n";

	if(!overrides.empty()) {
		out << string_format("Overrides -> p1: name=%s avatar=%s | p2: name=%s avatar=%s\n",
		                     describe(overrides.p1.name), describe(overrides.p1.avatar),
		                     describe(overrides.p2.name), describe(overrides.p2.avatar));
	}
}

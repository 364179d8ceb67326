#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include "rewrite.hpp"
#include "writer.hpp"

/**
 * A collection of values that govern application behavior.
 * Configuration values can be read from a configuration
 * file or from command-line options.
 * Configuration values come in an ordered hierarchy, where values
 * from higher configuration sources override lower ones.
 * From low to high, the sources are in this order:
 * 1. hard-coded default values
 * 2. configuration file in the working directory
 * 3. command-line options
 */
class Configuration
{

public:

	/**
	 * Initialize with default values.
	 */
	Configuration();

	Configuration(const Configuration& ) = default;
	Configuration(Configuration&& ) = default;
	Configuration& operator=(const Configuration& ) = default;
	Configuration& operator=(Configuration&& ) = default;

	/**
	 * Directory that contains the battle log and receives the replay.
	 */
	std::filesystem::path folder;

	/**
	 * File name of the battle log inside the folder.
	 */
	std::filesystem::path input;

	/**
	 * File name of the replay inside the folder.
	 */
	std::filesystem::path output;

	/**
	 * 0-based position of the battle to convert.
	 * If neither this nor the matchup is set, we convert the first battle.
	 */
	std::optional<int> battle_index;

	/**
	 * Header of the battle to convert, e.g. "Alder vs Cynthia".
	 * Takes precedence over the battle index.
	 */
	std::optional<std::string> matchup;

	/**
	 * If the log contains several battles with the selected matchup,
	 * convert the one at this 0-based occurrence.
	 */
	int occurrence;

	/**
	 * Instead of converting a battle, print the matchups in the log.
	 */
	bool list_matchups;

	/**
	 * Number of matchups to print when listing.
	 */
	int top_n;

	/**
	 * Player names and avatars to show in the replay, as configured per side.
	 */
	PlayerOverrides overrides;

	/**
	 * Name and avatar for both players. They apply to each side
	 * for which the specific value is not set.
	 */
	std::optional<std::string> both_name;
	std::optional<std::string> both_avatar;

	/**
	 * Kind of replay file to write.
	 */
	OutputFormat output_format;

	/**
	 * Location of the replay viewer that the HTML replay loads.
	 */
	std::string embed_base;

	/**
	 * The path location of the output log file.
	 */
	std::filesystem::path log_path;

	/**
	 * Return the per-side overrides, completed with the values for both
	 * players where a side's own value is missing or empty.
	 */
	PlayerOverrides effective_overrides() const;

	/**
	 * Full path of the battle log.
	 */
	std::filesystem::path input_path() const { return folder / input; }

	/**
	 * Full path of the replay file.
	 */
	std::filesystem::path output_path() const { return folder / output; }

	/**
	 * Read configuration values from the specified file.
	 * The syntax is "key = value" on every line, where key is the name of one of
	 * the member variables in this @c Configuration.
	 * Ignore lines that start with non-word characters.
	 */
	void read_from_file(std::filesystem::path path);

	/**
	 * Read configuration values from command-line arguments.
	 * The syntax is "--key=value" or "--key value" for every argument, where key
	 * is the name of one of the member variables in this @c Configuration.
	 * Dashes in the key count as underscores. Switches like "--list-matchups"
	 * may be given without a value.
	 */
	void read_from_args(int argc, const char* argv[]);

private:

	/**
	 * Set the configuration value with the given key name to the given value.
	 * Convert the string representation of the value to the correct type.
	 */
	void parse(std::string key, std::string value);

	/**
	 * Attempt to bring the configuration into a consistent state after loading it.
	 * @throw ConfigException if a value can not be made consistent.
	 */
	void normalize();

};


/**
 * Instantiate the members of the global context based on the configuration.
 */
void configure_context(const Configuration& configuration);

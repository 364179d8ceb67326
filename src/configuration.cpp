#include "configuration.hpp"
#include "context.hpp"
#include "globals.hpp"
#include "error.hpp"
#include <fstream>
#include <regex>
#include <functional>
#include <algorithm>
#include <stdexcept>
#include <map>
#include <set>

namespace
{

/**
 * If the string value contains data, convert it to an integer and return it.
 * If the string value is empty, return an empty optional.
 */
std::optional<int> to_opt_int(const std::string& value);

/**
 * If the string value contains data, return it.
 * If the string value is empty, return an empty optional.
 */
std::optional<std::string> to_opt_string(const std::string& value);

/**
 * Return the value if it is set and not empty, otherwise the alternative.
 */
std::optional<std::string> first_of(const std::optional<std::string>& value,
                                    const std::optional<std::string>& alternative);

/**
 * Type of a function that sets one configuration variable to the given value.
 */
using ConfigSetter = std::function<void(Configuration&, std::string)>;

/**
 * Lookup table of setter functions by configuration key name.
 */
extern const std::map<std::string, ConfigSetter> config_setter;

/**
 * Keys of boolean values, which may appear as switches without a value
 * on the command line.
 */
extern const std::set<std::string> config_switch;

/**
 * Return the key with all dashes replaced by underscores.
 */
std::string normalize_key(std::string key);

}


Configuration::Configuration()
: folder{DEFAULT_FOLDER},
  input{DEFAULT_INPUT},
  output{DEFAULT_OUTPUT},
  battle_index{},
  matchup{},
  occurrence{0},
  list_matchups{false},
  top_n{DEFAULT_TOP_N},
  overrides{},
  both_name{},
  both_avatar{},
  output_format{OutputFormat::HTML},
  embed_base{DEFAULT_EMBED_BASE},
  log_path{std::string(APP_NAME) + "-log.txt"}
{
}

PlayerOverrides Configuration::effective_overrides() const
{
	PlayerOverrides result;
	result.p1.name = first_of(overrides.p1.name, both_name);
	result.p1.avatar = first_of(overrides.p1.avatar, both_avatar);
	result.p2.name = first_of(overrides.p2.name, both_name);
	result.p2.avatar = first_of(overrides.p2.avatar, both_avatar);
	return result;
}

void Configuration::read_from_file(std::filesystem::path path)
{
	std::ifstream stream{path};
	std::string line;

	if(!stream.is_open())
		throwx<ConfigException>("Failed to open configuration file: %s", path.string().c_str());

	while(std::getline(stream, line)) {
		const std::regex line_ex{R"(^\s*([\w\.]+)[\s=]+(.*)$)"};
		std::cmatch result;

		if(std::regex_match(line.c_str(), result, line_ex)) {
			const std::string key{result[1]};
			const std::string value{trim(result[2])};
			parse(key, value);
		}
	}

	normalize();
}

void Configuration::read_from_args(int argc, const char* argv[])
{
	for(int i = 1; i < argc; i++) {
		const std::regex assign_ex{R"(^--\s*([\w-]+)[\s=]+(.*)$)"};
		std::cmatch result;
		const std::string arg{argv[i]};

		if(std::regex_match(argv[i], result, assign_ex)) {
			const std::string key{result[1]};
			const std::string value{result[2]};
			parse(key, value);
		}
		else if("--" == arg.substr(0, 2)) {
			const std::string key = normalize_key(arg.substr(2));
			const bool next_is_option = i+1 >= argc || "--" == std::string(argv[i + 1]).substr(0, 2);

			if(config_switch.count(key) && next_is_option) {
				parse(key, "true");
			}
			else if(i+1 < argc) {
				parse(key, argv[i + 1]);
				i++;
			}
			else {
				throwx<ConfigException>("Missing parameter for %s", argv[i]);
			}
		}
		else {
			throwx<ConfigException>("Unrecognized argument: %s", argv[i]);
		}
	}

	normalize();
}

void Configuration::parse(std::string key, std::string value)
{
	key = normalize_key(std::move(key));
	auto found = config_setter.find(key);

	if(config_setter.end() == found)
		throwx<ConfigException>("Unknown configuration key: %s", key.c_str());

	try {
		found->second(*this, value);
	}
	catch(const std::logic_error& ) {
		// std::stoi failed with invalid_argument or out_of_range
		throwx<ConfigException>("Invalid value for %s: \"%s\"", key.c_str(), value.c_str());
	}
}

void Configuration::normalize()
{
	if(battle_index.has_value() && battle_index.value() < 0)
		throwx<ConfigException>("Battle index must not be negative: %d", battle_index.value());

	if(occurrence < 0)
		throwx<ConfigException>("Occurrence must not be negative: %d", occurrence);

	if(top_n < 0)
		throwx<ConfigException>("Number of matchups to list must not be negative: %d", top_n);
}


void configure_context(const Configuration& configuration)
{
	the_context.configuration.reset(new Configuration(configuration));
	the_context.log = create_file_log(the_context.configuration->log_path);
}


namespace
{

std::optional<int> to_opt_int(const std::string& value)
{
	if(value.empty())
		return {};
	else
		return std::stoi(value);
}

std::optional<std::string> to_opt_string(const std::string& value)
{
	if(value.empty())
		return {};
	else
		return value;
}

std::optional<std::string> first_of(const std::optional<std::string>& value,
                                    const std::optional<std::string>& alternative)
{
	if(value && !value->empty())
		return value;
	else
		return alternative;
}

std::string normalize_key(std::string key)
{
	std::replace(key.begin(), key.end(), '-', '_');
	return key;
}

const std::map<std::string, ConfigSetter> config_setter
{
	{"folder",        [](Configuration& c, std::string value) { c.folder         = std::filesystem::path{value}; }},
	{"input",         [](Configuration& c, std::string value) { c.input          = std::filesystem::path{value}; }},
	{"output",        [](Configuration& c, std::string value) { c.output         = std::filesystem::path{value}; }},
	{"battle_index",  [](Configuration& c, std::string value) { c.battle_index   = to_opt_int(value); }},
	{"matchup",       [](Configuration& c, std::string value) { c.matchup        = to_opt_string(value); }},
	{"occurrence",    [](Configuration& c, std::string value) { c.occurrence     = std::stoi(value); }},
	{"list_matchups", [](Configuration& c, std::string value) { c.list_matchups  = "true" == value; }},
	{"top_n",         [](Configuration& c, std::string value) { c.top_n          = std::stoi(value); }},
	{"p1_name",       [](Configuration& c, std::string value) { c.overrides.p1.name   = to_opt_string(value); }},
	{"p1_avatar",     [](Configuration& c, std::string value) { c.overrides.p1.avatar = to_opt_string(value); }},
	{"p2_name",       [](Configuration& c, std::string value) { c.overrides.p2.name   = to_opt_string(value); }},
	{"p2_avatar",     [](Configuration& c, std::string value) { c.overrides.p2.avatar = to_opt_string(value); }},
	{"both_name",     [](Configuration& c, std::string value) { c.both_name      = to_opt_string(value); }},
	{"both_avatar",   [](Configuration& c, std::string value) { c.both_avatar    = to_opt_string(value); }},
	{"output_format", [](Configuration& c, std::string value) { c.output_format  = string_to_output_format(value); }},
	{"embed_base",    [](Configuration& c, std::string value) { c.embed_base     = value; }},
	{"log_path",      [](Configuration& c, std::string value) { c.log_path       = std::filesystem::path{value}; }},
};

const std::set<std::string> config_switch
{
	"list_matchups"
};

}

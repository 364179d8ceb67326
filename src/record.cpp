/**
 * Definitions for replay record building.
 */

#include "record.hpp"
#include "line.hpp"
#include "error.hpp"
#include <optional>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <limits>

namespace
{

const char* weekday_string[] =
{ "Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat" };

const char* month_string[] =
{ "Jan", "Feb", "Mar", "Apr", "May", "Jun", "Jul", "Aug", "Sep", "Oct", "Nov", "Dec" };

// the timestamp has room for four year digits
constexpr int MIN_YEAR = 1;
constexpr int MAX_YEAR = 9999;

/**
 * Convert the epoch time to broken-down UTC time.
 * Return false if the time is not representable.
 */
bool utc_time(std::time_t epoch, std::tm& result) noexcept;

}

ReplayRecord build_replay_record(const std::vector<std::string>& protocol_lines,
                                 const std::string& room_key,
                                 const std::string& room_fallback,
                                 std::time_t now)
{
	std::optional<std::string> player1;
	std::optional<std::string> player2;
	std::optional<std::string> format;
	std::optional<std::string> timestamp;

	for(const std::string& line : protocol_lines) {
		if(is_player_record(line, Side::P1)) {
			const std::string name = record_field(line, PLAYER_NAME_FIELD);
			if(!player1 && !name.empty())
				player1 = name;
		}
		else if(is_player_record(line, Side::P2)) {
			const std::string name = record_field(line, PLAYER_NAME_FIELD);
			if(!player2 && !name.empty())
				player2 = name;
		}
		else if(is_record(line, record::TIER)) {
			const std::string tier = record_field(line, RECORD_VALUE_FIELD);
			if(!format && !tier.empty())
				format = tier;
		}
		else if(!timestamp && is_record(line, record::TIME)) {
			try {
				timestamp = format_timestamp(parse_epoch(record_field(line, RECORD_VALUE_FIELD)));
			}
			catch(const TimestampException& ex) {
				Log::trace("Ignore time line \"%s\": %s", line.c_str(), ex.what());
			}
		}
	}

	ReplayRecord record;
	record.player1 = player1.value_or(side_to_string(Side::P1));
	record.player2 = player2.value_or(side_to_string(Side::P2));
	record.format = format.value_or(DEFAULT_FORMAT);
	record.timestamp = timestamp ? *timestamp : format_timestamp(now);
	record.log = protocol_lines;
	record.log.emplace_back(); // the replay viewer expects the log to end with an empty line
	record.input_log = "";
	record.room_id = sanitize_room_id(room_key, room_fallback);

	Log::info("Built replay \"%s\": %s vs. %s, %s, %s.", record.room_id.c_str(), record.player1.c_str(),
	          record.player2.c_str(), record.format.c_str(), record.timestamp.c_str());

	return record;
}

ReplayRecord build_replay_record(const std::vector<std::string>& protocol_lines,
                                 const std::string& room_key,
                                 const std::string& room_fallback)
{
	return build_replay_record(protocol_lines, room_key, room_fallback, std::time(nullptr));
}

std::string sanitize_room_id(const std::string& key, const std::string& fallback)
{
	std::string id;

	for(char c : to_lower(key)) {
		if(std::isdigit(static_cast<unsigned char>(c)) || (c >= 'a' && c <= 'z'))
			id += c;
	}

	if(id.empty())
		id = fallback;

	return id.substr(0, MAX_ROOM_ID_LENGTH);
}

std::string index_room_key(size_t index)
{
	return string_format("sim-battle-%zu", index);
}

std::string matchup_room_key(const std::string& matchup, int occurrence)
{
	return string_format("%s-%d", matchup.c_str(), occurrence);
}

std::time_t parse_epoch(const std::string& value)
{
	const std::string digits = trim(value);

	if(digits.empty())
		throwx<TimestampException>("Empty epoch time.");

	char* end = nullptr;
	errno = 0;
	const long long epoch = std::strtoll(digits.c_str(), &end, 10);

	if(end != digits.c_str() + digits.size())
		throwx<TimestampException>("Invalid epoch time: \"%s\"", value.c_str());

	if(ERANGE == errno ||
	   epoch < std::numeric_limits<std::time_t>::min() ||
	   epoch > std::numeric_limits<std::time_t>::max())
		throwx<TimestampException>("Epoch time out of range: \"%s\"", value.c_str());

	return static_cast<std::time_t>(epoch);
}

std::string format_timestamp(std::time_t epoch)
{
	std::tm utc{};

	if(!utc_time(epoch, utc))
		throwx<TimestampException>("Epoch time %lld is not representable.", static_cast<long long>(epoch));

	const int year = utc.tm_year + 1900;
	if(year < MIN_YEAR || year > MAX_YEAR)
		throwx<TimestampException>("Year %d of epoch time %lld is out of range.", year, static_cast<long long>(epoch));

	return string_format(TIMESTAMP_FORMAT, weekday_string[utc.tm_wday], month_string[utc.tm_mon],
	                     utc.tm_mday, utc.tm_year + 1900, utc.tm_hour, utc.tm_min, utc.tm_sec);
}

namespace
{

#if defined(_WIN32) || defined(_WIN64)

bool utc_time(std::time_t epoch, std::tm& result) noexcept
{
	return 0 == gmtime_s(&result, &epoch);
}

#else

bool utc_time(std::time_t epoch, std::tm& result) noexcept
{
	return nullptr != gmtime_r(&epoch, &result);
}

#endif // platform switches

}

#include "globals.hpp"
#include <algorithm>
#include <cassert>
#include <cctype>
#include <iterator>

namespace
{

const char* side_string[] =
{ "p1", "p2" };

}

const char* side_to_string(Side side) noexcept
{
	const size_t side_index = static_cast<size_t>(side);
	assert(side_index < std::size(side_string));
	return side_string[side_index];
}

std::string trim(const std::string& str)
{
	auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)); };

	const auto begin = std::find_if_not(str.begin(), str.end(), is_space);
	const auto end = std::find_if_not(str.rbegin(), std::string::const_reverse_iterator(begin), is_space).base();

	return std::string(begin, end);
}

std::string to_lower(std::string str)
{
	std::transform(str.begin(), str.end(), str.begin(),
		[](char c) { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); });
	return str;
}

std::vector<std::string> split(const std::string& str, char delimiter)
{
	std::vector<std::string> fields;
	size_t begin = 0;

	for(;;) {
		const size_t end = str.find(delimiter, begin);
		if(std::string::npos == end) {
			fields.push_back(str.substr(begin));
			break;
		}

		fields.push_back(str.substr(begin, end - begin));
		begin = end + 1;
	}

	return fields;
}

std::string join(const std::vector<std::string>& fields, char delimiter)
{
	std::string result;

	for(auto it = fields.begin(); fields.end() != it; ++it) {
		if(fields.begin() != it)
			result += delimiter;
		result += *it;
	}

	return result;
}

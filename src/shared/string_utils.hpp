#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace modevote {

/*
=============
ToLowerAscii

Returns a lowercase copy of the input using the classic locale rules.
=============
*/
inline std::string ToLowerAscii(std::string_view value)
{
	std::string lowered(value);
	std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	return lowered;
}

/*
=============
EqualsIgnoreCase
=============
*/
inline bool EqualsIgnoreCase(std::string_view a, std::string_view b)
{
	if (a.size() != b.size())
		return false;

	return std::equal(a.begin(), a.end(), b.begin(), [](unsigned char lhs, unsigned char rhs) {
		return std::tolower(lhs) == std::tolower(rhs);
	});
}

/*
=============
StartsWithIgnoreCase

Checks whether value begins with prefix, ignoring ASCII case.
=============
*/
inline bool StartsWithIgnoreCase(std::string_view value, std::string_view prefix)
{
	if (prefix.size() > value.size())
		return false;

	return EqualsIgnoreCase(value.substr(0, prefix.size()), prefix);
}

/*
=============
JoinStrings
=============
*/
inline std::string JoinStrings(const std::vector<std::string>& parts, std::string_view separator)
{
	std::string joined;
	for (size_t i = 0; i < parts.size(); ++i) {
		if (i > 0)
			joined.append(separator);
		joined.append(parts[i]);
	}
	return joined;
}

} // namespace modevote

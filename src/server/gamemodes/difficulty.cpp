#include "difficulty.hpp"

#include "../../shared/string_utils.hpp"

#include <array>
#include <charconv>
#include <string_view>

namespace modevote::server::gamemodes {
namespace {

struct DifficultySynonyms {
	float value;
	std::array<std::string_view, 5> synonyms;
};

// Sets are tried in this order and the first prefix hit wins, so "hardest"
// resolves to the hard level.
constexpr std::array<DifficultySynonyms, 5> kDifficultySets{ {
	{ kDifficultyBeginner, { "easy", "beginer", "beginner", "begginer", "begginner" } },
	{ kDifficultyNormal, { "regular", "default", "normal" } },
	{ kDifficultyHard, { "harder", "hard" } },
	{ kDifficultySuicidal, { "suicidal" } },
	{ kDifficultyHellOnEarth, { "expert", "hardest", "hell on earth", "hoe" } },
} };

/*
=============
ParseLiteralDifficulty

Reads the leading numeric portion of the label, returning 0 when there is
none.
=============
*/
float ParseLiteralDifficulty(std::string_view label)
{
	const size_t start = label.find_first_not_of(" \t");
	if (start == std::string_view::npos)
		return 0.0f;
	label.remove_prefix(start);
	if (!label.empty() && label.front() == '+')
		label.remove_prefix(1);

	float value = 0.0f;
	const auto result = std::from_chars(label.data(), label.data() + label.size(), value);
	if (result.ec != std::errc())
		return 0.0f;

	return value;
}

} // namespace

/*
=============
ResolveDifficulty
=============
*/
float ResolveDifficulty(std::string_view label)
{
	for (const auto& set : kDifficultySets) {
		for (std::string_view synonym : set.synonyms) {
			if (synonym.empty())
				continue;
			if (StartsWithIgnoreCase(label, synonym))
				return set.value;
		}
	}

	return ParseLiteralDifficulty(label);
}

} // namespace modevote::server::gamemodes

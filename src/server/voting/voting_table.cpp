#include "voting_table.hpp"

#include "../../shared/string_utils.hpp"

namespace modevote::server::voting {

/*
=============
EncodeOptions
=============
*/
std::string EncodeOptions(const std::vector<gamemodes::GameOption>& options)
{
	std::string encoded;
	for (const auto& option : options) {
		if (!encoded.empty())
			encoded.push_back('?');
		encoded.append(option.key);
		encoded.push_back('=');
		encoded.append(option.value);
	}
	return encoded;
}

/*
=============
EncodeAddons
=============
*/
std::string EncodeAddons(const std::vector<std::string>& addons)
{
	return JoinStrings(addons, ",");
}

/*
=============
BuildVotingTableRow
=============
*/
host::VotingTableRow BuildVotingTableRow(const gamemodes::GameMode& mode)
{
	host::VotingTableRow row;
	row.gameTypeClass = mode.GetGameTypeClass();
	row.title = mode.GetTitle().empty() ? mode.GetName() : mode.GetTitle();
	row.prefix = mode.GetMapPrefix();
	row.acronym = mode.GetAcronym();
	row.addons = EncodeAddons(mode.GetIncludedAddons());
	row.options = EncodeOptions(mode.GetOptions());
	return row;
}

} // namespace modevote::server::voting

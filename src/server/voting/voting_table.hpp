#pragma once

#include "../gamemodes/game_mode.hpp"
#include "../host/voting_component.hpp"

#include <string>
#include <vector>

namespace modevote::server::voting {

/*
=============
EncodeOptions

Joins options into the host's key=value?key=value form.
=============
*/
std::string EncodeOptions(const std::vector<gamemodes::GameOption>& options);

/*
=============
EncodeAddons
=============
*/
std::string EncodeAddons(const std::vector<std::string>& addons);

/*
=============
BuildVotingTableRow

Builds the row the host displays for a mode. Only the safe subset of
options and add-ons is encoded.
=============
*/
host::VotingTableRow BuildVotingTableRow(const gamemodes::GameMode& mode);

} // namespace modevote::server::voting

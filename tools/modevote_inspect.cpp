// Copyright (c) DarkMatter Projects 2023-2025
// Licensed under the GNU General Public License 2.0.
//
// modevote_inspect.cpp - Prints every configured game mode, the voting row
// it would produce and any validation warnings.

#include "server/gamemodes/difficulty.hpp"
#include "server/gamemodes/game_mode_registry.hpp"
#include "server/voting/voting_table.hpp"
#include "shared/logger.hpp"
#include "shared/version.hpp"

#include <json/json.h>

#include <iostream>
#include <string>

using namespace modevote;
using namespace modevote::server;

/*
=============
main
=============
*/
int main(int argc, char** argv)
{
	InitLogger("inspect", [](std::string_view message) {
		std::cout << message;
	}, [](std::string_view message) {
		std::cerr << message;
	});

	if (argc < 2) {
		std::cerr << "Usage: " << argv[0] << " <gamemodes.json>\n";
		return 1;
	}

	gamemodes::GameModeRegistry registry;
	if (!registry.LoadFromFile(argv[1]))
		return 1;

	Json::StreamWriterBuilder writer;
	writer["indentation"] = "  ";

	std::cout << version::kModuleTitle << ' ' << version::kModuleVersion << '\n';
	for (const auto* mode : registry.GetNamedInstances()) {
		mode->ValidateOptions();
		mode->ValidateAddons();

		const host::VotingTableRow row = voting::BuildVotingTableRow(*mode);
		std::cout << "\n[" << mode->GetName() << "]\n";
		std::cout << Json::writeString(writer, mode->ToData()) << '\n';
		std::cout << "difficulty: " << mode->GetDifficulty() << " -> " << gamemodes::ResolveDifficulty(mode->GetDifficulty()) << '\n';
		std::cout << "row: " << row.gameTypeClass << " | " << row.title << " | " << row.prefix << " | "
			<< row.acronym << " | " << row.addons << " | " << row.options << '\n';
	}

	return 0;
}

/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

test_game_mode_option_validation.cpp implementation.*/

#include "server/gamemodes/game_mode.hpp"
#include "test_support.hpp"

#include <json/json.h>

#include <cassert>
#include <string>

using namespace modevote::server::gamemodes;

/*
=============
AddOption
=============
*/
static void AddOption(Json::Value& section, const std::string& key, const std::string& value)
{
	Json::Value entry(Json::objectValue);
	entry["key"] = key;
	entry["value"] = value;
	section["options"].append(entry);
}

/*
=============
main

Unsafe option pairs and add-on names are dropped from the effective lists
and reported once each.
=============
*/
int main()
{
	modevote::tests::LogCapture logs;

	Json::Value section(Json::objectValue);
	section["options"] = Json::Value(Json::arrayValue);
	AddOption(section, "MaxPlayers", "6");
	AddOption(section, "Evil?Key", "1");
	AddOption(section, "GameLength", "2");
	AddOption(section, "Mutator", "a=b");
	AddOption(section, "Zeds", "");

	section["includeAddon"] = Json::Value(Json::arrayValue);
	section["includeAddon"].append("ServerPerks.ServerPerksMut");
	section["includeAddon"].append("Two,Mutators");
	section["includeAddon"].append("");
	section["includeAddon"].append("Whitelist.Mut");

	const GameMode mode = GameMode::Load("validated", section);

	const auto options = mode.GetOptions();
	assert(options.size() == 3);
	assert(options[0].key == "MaxPlayers" && options[0].value == "6");
	assert(options[1].key == "GameLength" && options[1].value == "2");
	assert(options[2].key == "Zeds" && options[2].value.empty());

	assert(logs.Warnings() == 0);
	mode.ValidateOptions();
	assert(logs.Warnings() == 2);
	assert(logs.Contains("\"validated\""));
	assert(logs.Contains("\"Evil?Key\""));
	assert(logs.Contains("\"a=b\""));

	logs.Clear();
	const auto addons = mode.GetIncludedAddons();
	assert(addons.size() == 2);
	assert(addons[0] == "ServerPerks.ServerPerksMut");
	assert(addons[1] == "Whitelist.Mut");
	mode.ValidateAddons();
	assert(logs.Warnings() == 2);
	assert(logs.Contains("Two,Mutators"));

	assert(!GameMode::IsOptionSafe({ "a", "b?c" }));
	assert(GameMode::IsOptionSafe({ "a", "b c" }));
	assert(!GameMode::IsAddonNameSafe(""));

	return 0;
}

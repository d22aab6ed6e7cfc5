/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

test_bootstrap_config.cpp implementation.*/

#include "server/bootstrap/bootstrap_config.hpp"
#include "test_support.hpp"

#include <json/json.h>

#include <cassert>
#include <cstdio>
#include <fstream>

using namespace modevote::server::bootstrap;

/*
=============
main
=============
*/
int main()
{
	modevote::tests::LogCapture logs;

	const BootstrapConfig defaults = LoadBootstrapConfig("definitely_missing_modevote.json");
	assert(defaults.useGameModes);
	assert(defaults.packages.empty());
	assert(defaults.gameModesFile == "gamemodes.json");
	assert(logs.Warnings() == 1);

	Json::Value root(Json::objectValue);
	root["useGameModes"] = false;
	root["gameModesFile"] = "custom_modes.json";
	root["packages"] = Json::Value(Json::arrayValue);
	root["packages"].append("CoreFixes");
	root["packages"].append(3);
	root["packages"].append("FuturePack");
	logs.Clear();
	const BootstrapConfig parsed = ParseBootstrapConfig(root);
	assert(!parsed.useGameModes);
	assert(parsed.gameModesFile == "custom_modes.json");
	assert(parsed.packages.size() == 2);
	assert(parsed.packages[1] == "FuturePack");
	assert(logs.Warnings() == 1);

	Json::Value wrong(Json::objectValue);
	wrong["useGameModes"] = "yes";
	wrong["gameModesFile"] = "";
	wrong["packages"] = "CoreFixes";
	logs.Clear();
	const BootstrapConfig ignored = ParseBootstrapConfig(wrong);
	assert(ignored.useGameModes);
	assert(ignored.gameModesFile == "gamemodes.json");
	assert(ignored.packages.empty());
	assert(logs.Warnings() == 3);

	const char* path = "test_bootstrap_config.json";
	{
		std::ofstream out(path);
		out << R"({ "useGameModes": true, "packages": [ "CoreFixes" ] })";
	}
	const BootstrapConfig fromFile = LoadBootstrapConfig(path);
	assert(fromFile.useGameModes);
	assert(fromFile.packages.size() == 1);

	{
		std::ofstream out(path);
		out << "{ not json";
	}
	logs.Clear();
	const BootstrapConfig broken = LoadBootstrapConfig(path);
	assert(broken.packages.empty());
	assert(logs.Count("[ERROR]") == 1);
	std::remove(path);

	return 0;
}

#pragma once

#include <json/json.h>

#include <string>
#include <vector>

namespace modevote::server::bootstrap {

inline constexpr const char* kDefaultGameModesFile = "gamemodes.json";

struct BootstrapConfig {
	bool useGameModes = true;
	std::vector<std::string> packages;
	std::string gameModesFile = kDefaultGameModesFile;
};

/*
=============
ParseBootstrapConfig

Reads known keys from root, keeping defaults for anything missing or of the
wrong type.
=============
*/
BootstrapConfig ParseBootstrapConfig(const Json::Value& root);

/*
=============
LoadBootstrapConfig

Reads modevote.json. A missing file or a parse failure yields the defaults.
=============
*/
BootstrapConfig LoadBootstrapConfig(const std::string& path);

} // namespace modevote::server::bootstrap

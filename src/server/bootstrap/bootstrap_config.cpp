#include "bootstrap_config.hpp"

#include "../../shared/logger.hpp"

#include <fstream>

namespace modevote::server::bootstrap {

/*
=============
ParseBootstrapConfig
=============
*/
BootstrapConfig ParseBootstrapConfig(const Json::Value& root)
{
	BootstrapConfig config;
	if (!root.isObject()) {
		Log(LogLevel::Error, "Bootstrap config must be a JSON object, using defaults.");
		return config;
	}

	if (root.isMember("useGameModes")) {
		if (root["useGameModes"].isBool())
			config.useGameModes = root["useGameModes"].asBool();
		else
			Log(LogLevel::Warn, "Bootstrap config: 'useGameModes' must be a boolean, ignoring.");
	}

	if (root.isMember("gameModesFile")) {
		const Json::Value& file = root["gameModesFile"];
		if (file.isString() && !file.asString().empty())
			config.gameModesFile = file.asString();
		else
			Log(LogLevel::Warn, "Bootstrap config: 'gameModesFile' must be a non-empty string, ignoring.");
	}

	if (root.isMember("packages")) {
		const Json::Value& packages = root["packages"];
		if (!packages.isArray()) {
			Log(LogLevel::Warn, "Bootstrap config: 'packages' must be an array, ignoring.");
		}
		else {
			for (const auto& entry : packages) {
				if (entry.isString() && !entry.asString().empty())
					config.packages.push_back(entry.asString());
				else
					Log(LogLevel::Warn, "Bootstrap config: skipping invalid package entry.");
			}
		}
	}

	return config;
}

/*
=============
LoadBootstrapConfig
=============
*/
BootstrapConfig LoadBootstrapConfig(const std::string& path)
{
	std::ifstream file(path, std::ifstream::binary);
	if (!file.is_open()) {
		Logf(LogLevel::Warn, "{}: no config at '{}', using defaults.", __FUNCTION__, path);
		return {};
	}

	Json::Value root;
	Json::CharReaderBuilder builder;
	std::string errs;
	if (!Json::parseFromStream(builder, file, &root, &errs)) {
		Logf(LogLevel::Error, "{}: JSON parsing failed for '{}': {}", __FUNCTION__, path, errs);
		return {};
	}

	return ParseBootstrapConfig(root);
}

} // namespace modevote::server::bootstrap

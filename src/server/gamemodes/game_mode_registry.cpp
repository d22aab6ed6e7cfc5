#include "game_mode_registry.hpp"

#include "../../shared/logger.hpp"
#include "../../shared/string_utils.hpp"

#include <algorithm>
#include <fstream>
#include <utility>

namespace modevote::server::gamemodes {

/*
==================
GameModeRegistry::LoadFromFile
==================
*/
bool GameModeRegistry::LoadFromFile(const std::string& path)
{
	modes_.clear();

	std::ifstream file(path, std::ifstream::binary);
	if (!file.is_open()) {
		Logf(LogLevel::Error, "{}: failed to open game mode file '{}'.", __FUNCTION__, path);
		return false;
	}

	Json::Value root;
	Json::CharReaderBuilder builder;
	std::string errs;

	if (!Json::parseFromStream(builder, file, &root, &errs)) {
		Logf(LogLevel::Error, "{}: JSON parsing failed for '{}': {}", __FUNCTION__, path, errs);
		return false;
	}

	return LoadFromJson(root);
}

/*
==================
GameModeRegistry::LoadFromJson

Reads the "gameModes" array. Entries without a usable name, or whose name
is already taken, are skipped.
==================
*/
bool GameModeRegistry::LoadFromJson(const Json::Value& root)
{
	modes_.clear();

	if (!root.isObject() || !root.isMember("gameModes") || !root["gameModes"].isArray()) {
		Logf(LogLevel::Error, "{}: JSON must contain a 'gameModes' array.", __FUNCTION__);
		return false;
	}

	std::vector<GameMode> newModes;
	int skipped = 0;
	for (const auto& entry : root["gameModes"]) {
		if (!entry.isObject() || !entry["name"].isString() || entry["name"].asString().empty()) {
			Log(LogLevel::Warn, "Skipping game mode entry without a name.");
			skipped++;
			continue;
		}

		std::string name = entry["name"].asString();
		const bool duplicate = std::any_of(newModes.begin(), newModes.end(), [&](const GameMode& mode) {
			return EqualsIgnoreCase(mode.GetName(), name);
		});
		if (duplicate) {
			Logf(LogLevel::Warn, "Skipping duplicate game mode \"{}\".", name);
			skipped++;
			continue;
		}

		newModes.push_back(GameMode::Load(std::move(name), entry));
	}

	modes_.swap(newModes);
	Logf(LogLevel::Info, "Loaded {} game mode{}, skipped {} entr{}.",
		modes_.size(), modes_.size() == 1 ? "" : "s",
		skipped, skipped == 1 ? "y" : "ies");
	return true;
}

/*
==================
GameModeRegistry::GetNamedInstances
==================
*/
std::vector<const GameMode*> GameModeRegistry::GetNamedInstances() const
{
	std::vector<const GameMode*> result;
	result.reserve(modes_.size());
	for (const auto& mode : modes_)
		result.push_back(&mode);
	return result;
}

/*
==================
GameModeRegistry::GetInstance
==================
*/
const GameMode* GameModeRegistry::GetInstance(std::string_view name) const
{
	for (const auto& mode : modes_) {
		if (EqualsIgnoreCase(mode.GetName(), name))
			return &mode;
	}
	return nullptr;
}

} // namespace modevote::server::gamemodes

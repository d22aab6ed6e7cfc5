// Copyright (c) DarkMatter Projects 2023-2025
// Licensed under the GNU General Public License 2.0.
//
// game_mode.cpp (Game Mode Entity)
// Loads a single game mode from its config section and converts it to and
// from a Json::Value tree. The data keys are the same keys used by the config
// file, so a mode written out with ToData can be pasted back into
// gamemodes.json.
//
// Key Responsibilities:
// - Field Loading: `FromData` accepts any subset of the known keys; wrongly
//   typed values are reported and ignored.
// - Option Safety: `GetOptions` drops pairs that would corrupt the host's
//   `?`-separated option string and `ValidateOptions` reports them.
// - Feature Overrides: `UpdateFeatureArray` applies the mode's feature
//   include/exclude lists on top of the session's auto-configuration.

#include "game_mode.hpp"

#include "../../shared/logger.hpp"
#include "../../shared/string_utils.hpp"

#include <algorithm>
#include <utility>

namespace modevote::server::gamemodes {
namespace {

/*
=============
ReadString

Copies a string member into out. Non-string values are reported and leave
out untouched.
=============
*/
void ReadString(const Json::Value& data, const char* key, std::string& out, std::string_view modeName)
{
	if (!data.isMember(key))
		return;

	const Json::Value& value = data[key];
	if (!value.isString()) {
		Logf(LogLevel::Warn, "Game mode \"{}\": field '{}' must be a string, ignoring.", modeName, key);
		return;
	}

	out = value.asString();
}

/*
=============
ReadStringArray
=============
*/
void ReadStringArray(const Json::Value& data, const char* key, std::vector<std::string>& out, std::string_view modeName)
{
	if (!data.isMember(key))
		return;

	const Json::Value& array = data[key];
	if (!array.isArray()) {
		Logf(LogLevel::Warn, "Game mode \"{}\": field '{}' must be an array, ignoring.", modeName, key);
		return;
	}

	for (const auto& entry : array) {
		if (!entry.isString()) {
			Logf(LogLevel::Warn, "Game mode \"{}\": non-string entry in '{}' skipped.", modeName, key);
			continue;
		}
		out.push_back(entry.asString());
	}
}

/*
=============
ReadOptions
=============
*/
void ReadOptions(const Json::Value& data, std::vector<GameOption>& out, std::string_view modeName)
{
	if (!data.isMember("options"))
		return;

	const Json::Value& array = data["options"];
	if (!array.isArray()) {
		Logf(LogLevel::Warn, "Game mode \"{}\": field 'options' must be an array, ignoring.", modeName);
		return;
	}

	for (const auto& entry : array) {
		if (!entry.isObject() || !entry["key"].isString() || !entry.get("value", "").isString()) {
			Logf(LogLevel::Warn, "Game mode \"{}\": malformed option entry skipped.", modeName);
			continue;
		}
		out.push_back({ entry["key"].asString(), entry.get("value", "").asString() });
	}
}

/*
=============
ReadFeaturePairs
=============
*/
void ReadFeaturePairs(const Json::Value& data, std::vector<features::FeatureConfigPair>& out, std::string_view modeName)
{
	if (!data.isMember("includeFeature"))
		return;

	const Json::Value& array = data["includeFeature"];
	if (!array.isArray()) {
		Logf(LogLevel::Warn, "Game mode \"{}\": field 'includeFeature' must be an array, ignoring.", modeName);
		return;
	}

	for (const auto& entry : array) {
		if (!entry.isObject() || !entry["feature"].isString() || !entry.get("config", "").isString()) {
			Logf(LogLevel::Warn, "Game mode \"{}\": malformed includeFeature entry skipped.", modeName);
			continue;
		}
		out.push_back({ entry["feature"].asString(), entry.get("config", "").asString() });
	}
}

} // namespace

/*
=============
GameMode::GameMode
=============
*/
GameMode::GameMode(std::string name)
	: name_(std::move(name)) {}

/*
=============
GameMode::Load

Builds a mode from the named config section.
=============
*/
GameMode GameMode::Load(std::string name, const Json::Value& section)
{
	GameMode mode(std::move(name));
	mode.FromData(section);
	return mode;
}

/*
=============
GameMode::ToData
=============
*/
Json::Value GameMode::ToData() const
{
	Json::Value data(Json::objectValue);
	data["title"] = title_;
	data["difficulty"] = difficulty_;
	data["gameTypeClass"] = gameTypeClass_;
	data["acronym"] = acronym_;
	data["mapPrefix"] = mapPrefix_;

	Json::Value options(Json::arrayValue);
	for (const auto& option : options_) {
		Json::Value entry(Json::objectValue);
		entry["key"] = option.key;
		entry["value"] = option.value;
		options.append(entry);
	}
	data["options"] = options;

	Json::Value addons(Json::arrayValue);
	for (const auto& addon : includeAddon_)
		addons.append(addon);
	data["includeAddon"] = addons;

	Json::Value included(Json::arrayValue);
	for (const auto& pair : includeFeature_) {
		Json::Value entry(Json::objectValue);
		entry["feature"] = pair.feature;
		entry["config"] = pair.config;
		included.append(entry);
	}
	data["includeFeature"] = included;

	Json::Value excluded(Json::arrayValue);
	for (const auto& feature : excludeFeature_)
		excluded.append(feature);
	data["excludeFeature"] = excluded;

	return data;
}

/*
=============
GameMode::FromData

Replaces every declared field with the contents of data. Keys that are
absent reset the field to its default.
=============
*/
void GameMode::FromData(const Json::Value& data)
{
	title_.clear();
	difficulty_.clear();
	gameTypeClass_.clear();
	acronym_.clear();
	mapPrefix_.clear();
	options_.clear();
	includeAddon_.clear();
	includeFeature_.clear();
	excludeFeature_.clear();

	if (data.isNull())
		return;
	if (!data.isObject()) {
		Logf(LogLevel::Warn, "Game mode \"{}\": config section must be an object.", name_);
		return;
	}

	ReadString(data, "title", title_, name_);
	ReadString(data, "difficulty", difficulty_, name_);
	ReadString(data, "gameTypeClass", gameTypeClass_, name_);
	ReadString(data, "acronym", acronym_, name_);
	ReadString(data, "mapPrefix", mapPrefix_, name_);
	ReadOptions(data, options_, name_);
	ReadStringArray(data, "includeAddon", includeAddon_, name_);
	ReadFeaturePairs(data, includeFeature_, name_);
	ReadStringArray(data, "excludeFeature", excludeFeature_, name_);
}

/*
=============
GameMode::GetDifficulty
=============
*/
std::string GameMode::GetDifficulty() const
{
	if (difficulty_.empty())
		return std::string(kFallbackDifficulty);
	return difficulty_;
}

/*
=============
GameMode::GetAcronym
=============
*/
std::string GameMode::GetAcronym() const
{
	if (acronym_.empty())
		return name_;
	return acronym_;
}

/*
=============
GameMode::GetMapPrefix
=============
*/
std::string GameMode::GetMapPrefix() const
{
	if (mapPrefix_.empty())
		return std::string(kFallbackMapPrefix);
	return mapPrefix_;
}

/*
=============
GameMode::IsOptionSafe

The host joins options as key=value?key=value, so neither separator may
appear inside a key or a value.
=============
*/
bool GameMode::IsOptionSafe(const GameOption& option)
{
	constexpr std::string_view unsafe = "?=";
	return option.key.find_first_of(unsafe) == std::string::npos
		&& option.value.find_first_of(unsafe) == std::string::npos;
}

/*
=============
GameMode::IsAddonNameSafe
=============
*/
bool GameMode::IsAddonNameSafe(std::string_view addon)
{
	return !addon.empty() && addon.find(',') == std::string_view::npos;
}

/*
=============
GameMode::GetOptions
=============
*/
std::vector<GameOption> GameMode::GetOptions() const
{
	std::vector<GameOption> result;
	result.reserve(options_.size());
	for (const auto& option : options_) {
		if (IsOptionSafe(option))
			result.push_back(option);
	}
	return result;
}

/*
=============
GameMode::GetIncludedAddons
=============
*/
std::vector<std::string> GameMode::GetIncludedAddons() const
{
	std::vector<std::string> result;
	result.reserve(includeAddon_.size());
	for (const auto& addon : includeAddon_) {
		if (IsAddonNameSafe(addon))
			result.push_back(addon);
	}
	return result;
}

/*
=============
GameMode::ValidateOptions
=============
*/
void GameMode::ValidateOptions() const
{
	for (const auto& option : options_) {
		if (IsOptionSafe(option))
			continue;

		Logf(LogLevel::Warn, "Game mode \"{}\" has option \"{}\" with value \"{}\" containing '?' or '=', it will be ignored.",
			name_, option.key, option.value);
	}
}

/*
=============
GameMode::ValidateAddons
=============
*/
void GameMode::ValidateAddons() const
{
	for (const auto& addon : includeAddon_) {
		if (IsAddonNameSafe(addon))
			continue;

		Logf(LogLevel::Warn, "Game mode \"{}\" includes invalid add-on name \"{}\", it will be ignored.", name_, addon);
	}
}

/*
=============
GameMode::UpdateFeatureArray

Drops excluded features, then applies included ones: an already listed
feature gets the mode's config, a new one is appended.
=============
*/
void GameMode::UpdateFeatureArray(std::vector<features::FeatureConfigPair>& featureArray) const
{
	std::erase_if(featureArray, [this](const features::FeatureConfigPair& pair) {
		return std::any_of(excludeFeature_.begin(), excludeFeature_.end(), [&](const std::string& excluded) {
			return EqualsIgnoreCase(excluded, pair.feature);
		});
	});

	for (const auto& included : includeFeature_) {
		auto it = std::find_if(featureArray.begin(), featureArray.end(), [&](const features::FeatureConfigPair& pair) {
			return EqualsIgnoreCase(pair.feature, included.feature);
		});

		if (it != featureArray.end())
			it->config = included.config;
		else
			featureArray.push_back(included);
	}
}

} // namespace modevote::server::gamemodes

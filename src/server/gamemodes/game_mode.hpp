// Copyright (c) DarkMatter Projects 2023-2025
// Licensed under the GNU General Public License 2.0.
//
// game_mode.hpp - Named, config-loaded description of one selectable mode.

#pragma once

#include "../features/feature_environment.hpp"

#include <json/json.h>

#include <string>
#include <string_view>
#include <vector>

namespace modevote::server::gamemodes {

inline constexpr std::string_view kFallbackDifficulty{"normal"};
inline constexpr std::string_view kFallbackMapPrefix{"KF"};

// One key=value pair appended to the host's URL-style option string.
struct GameOption {
	std::string key;
	std::string value;

	bool operator==(const GameOption&) const = default;
};

/*
=================
GameMode

A named game variant read from a config section. Raw field values are kept
exactly as configured so ToData/FromData round-trip them unchanged; fallback
values are applied only by the getters.
=================
*/
class GameMode {
	public:
	explicit GameMode(std::string name);

	static GameMode Load(std::string name, const Json::Value& section);

	[[nodiscard]] Json::Value ToData() const;
	void FromData(const Json::Value& data);

	const std::string& GetName() const { return name_; }
	const std::string& GetTitle() const { return title_; }
	std::string GetDifficulty() const;
	const std::string& GetGameTypeClass() const { return gameTypeClass_; }
	std::string GetAcronym() const;
	std::string GetMapPrefix() const;

	// Options and add-ons with unsafe entries removed, in configured order.
	std::vector<GameOption> GetOptions() const;
	std::vector<std::string> GetIncludedAddons() const;

	const std::vector<features::FeatureConfigPair>& GetIncludedFeatures() const { return includeFeature_; }
	const std::vector<std::string>& GetExcludedFeatures() const { return excludeFeature_; }

	// Report unsafe entries; each one produces exactly one warning.
	void ValidateOptions() const;
	void ValidateAddons() const;

	void UpdateFeatureArray(std::vector<features::FeatureConfigPair>& featureArray) const;

	// Raw configured values, used by data conversion and tests.
	const std::string& RawDifficulty() const { return difficulty_; }
	const std::string& RawAcronym() const { return acronym_; }
	const std::string& RawMapPrefix() const { return mapPrefix_; }
	const std::vector<GameOption>& RawOptions() const { return options_; }
	const std::vector<std::string>& RawIncludedAddons() const { return includeAddon_; }

	static bool IsOptionSafe(const GameOption& option);
	static bool IsAddonNameSafe(std::string_view addon);

	private:
	std::string name_;
	std::string title_;
	std::string difficulty_;
	std::string gameTypeClass_;
	std::string acronym_;
	std::string mapPrefix_;
	std::vector<GameOption> options_;
	std::vector<std::string> includeAddon_;
	std::vector<features::FeatureConfigPair> includeFeature_;
	std::vector<std::string> excludeFeature_;
};

} // namespace modevote::server::gamemodes

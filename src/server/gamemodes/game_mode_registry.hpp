#pragma once

#include "game_mode.hpp"

#include <json/json.h>

#include <string>
#include <string_view>
#include <vector>

namespace modevote::server::gamemodes {

/*
=================
GameModeRegistry

Owns every configured GameMode in declaration order. Names are unique,
compared case-insensitively; the registry rejects duplicates at load time.
Pointers it hands out stay valid until the next load or Clear, so holders
that outlive a reload keep the mode name instead.
=================
*/
class GameModeRegistry {
	public:
	// Replaces the current contents. Returns false when the file could not be
	// read or parsed; the registry is left empty in that case.
	bool LoadFromFile(const std::string& path);
	bool LoadFromJson(const Json::Value& root);

	std::vector<const GameMode*> GetNamedInstances() const;
	const GameMode* GetInstance(std::string_view name) const;

	size_t Size() const { return modes_.size(); }
	void Clear() { modes_.clear(); }

	private:
	std::vector<GameMode> modes_;
};

} // namespace modevote::server::gamemodes

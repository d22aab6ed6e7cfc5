// Copyright (c) DarkMatter Projects 2023-2025
// Licensed under the GNU General Public License 2.0.
//
// voting_adapter.hpp - Injects game modes into the host voting table and
// carries the players' choice across the map change.

#pragma once

#include "../gamemodes/game_mode.hpp"
#include "../gamemodes/game_mode_registry.hpp"
#include "../host/host_engine.hpp"
#include "../host/voting_component.hpp"
#include "../session/session_checkpoint.hpp"

#include <string>
#include <vector>

namespace modevote::server::voting {

enum class TravelResult {
	Prepared,
	NotInjected,
	NotVoteTriggered,
	HostIndexOutOfRange,
	ModeIndexOutOfRange,
	ModeNotFound,
};

/*
=================
VotingAdapter

Replaces the host voting table with one row per game mode and later maps the
voted row back to its mode. Row i of the injected table always belongs to
mode i of the list given to Inject; that index is the only thing the host
reports back, so both bounds are checked here before it is trusted. Modes
are remembered by name and resolved through the registry when needed, since
the registry may be reloaded while a session is running.
=================
*/
class VotingAdapter {
	public:
	VotingAdapter(host::HostEngine& engine, const gamemodes::GameModeRegistry& registry,
		session::SessionCheckpointService& checkpoints);

	bool Inject(const std::vector<const gamemodes::GameMode*>& modes);
	TravelResult PrepareForTravel();
	const gamemodes::GameMode* SetupAfterTravel();
	void RestoreBackup();

	bool IsInjected() const { return injected_; }

	private:
	host::HostEngine& engine_;
	const gamemodes::GameModeRegistry& registry_;
	session::SessionCheckpointService& checkpoints_;

	host::VotingComponent* votingComponent_ = nullptr;
	host::VotingTable backup_;
	std::vector<std::string> injectedModeNames_;
	bool injected_ = false;
};

} // namespace modevote::server::voting

// Copyright (c) DarkMatter Projects 2023-2025
// Licensed under the GNU General Public License 2.0.
//
// voting_adapter.cpp (Voting Table Adapter)
// The host's voting component knows nothing about game modes. It shows a
// table of rows and, once a vote passes, remembers the index of the winning
// row before restarting the server on the next map. This adapter swaps that
// table for one built from our game modes, then turns the winning index back
// into a mode name that survives the restart through the session checkpoint.
//
// Key Responsibilities:
// - Injection: `Inject` backs up the host table and installs one row per mode.
// - Travel: `PrepareForTravel` validates the voted index against both the
//   host table and our own list, then writes the checkpoint and bakes the
//   mode's difficulty into the host default.
// - Restore: `RestoreBackup` puts the original table back into both host
//   copies so the host never saves our rows to its config.
// - Setup: `SetupAfterTravel` consumes the checkpoint in the new session.

#include "voting_adapter.hpp"

#include "voting_table.hpp"

#include "../gamemodes/difficulty.hpp"
#include "../../shared/logger.hpp"

#include <utility>

namespace modevote::server::voting {

/*
=============
VotingAdapter::VotingAdapter
=============
*/
VotingAdapter::VotingAdapter(host::HostEngine& engine, const gamemodes::GameModeRegistry& registry,
	session::SessionCheckpointService& checkpoints)
	: engine_(engine)
	, registry_(registry)
	, checkpoints_(checkpoints) {}

/*
=============
VotingAdapter::Inject

Returns whether the adapter is injected once the call completes.
=============
*/
bool VotingAdapter::Inject(const std::vector<const gamemodes::GameMode*>& modes)
{
	if (injected_)
		return true;

	host::VotingComponent* component = engine_.FindVotingComponent();
	if (!component) {
		Log(LogLevel::Fatal, "No voting component found, game mode voting is unavailable for this session.");
		return false;
	}

	std::vector<const gamemodes::GameMode*> usable;
	usable.reserve(modes.size());
	for (const auto* mode : modes) {
		if (mode)
			usable.push_back(mode);
	}

	if (usable.empty()) {
		Log(LogLevel::Warn, "No game modes configured, leaving the voting table untouched.");
		return false;
	}

	host::VotingTable replacement;
	replacement.reserve(usable.size());
	for (const auto* mode : usable) {
		mode->ValidateOptions();
		mode->ValidateAddons();
		replacement.push_back(BuildVotingTableRow(*mode));
	}

	injectedModeNames_.clear();
	injectedModeNames_.reserve(usable.size());
	for (const auto* mode : usable)
		injectedModeNames_.push_back(mode->GetName());

	votingComponent_ = component;
	backup_ = component->LiveTable();
	component->LiveTable() = std::move(replacement);
	injected_ = true;

	Logf(LogLevel::Info, "Injected {} game mode{} into the voting table.",
		injectedModeNames_.size(), injectedModeNames_.size() == 1 ? "" : "s");
	return true;
}

/*
=============
VotingAdapter::PrepareForTravel

Called when the host announces a map change. Only vote-driven changes are
recorded; admin map changes must start the next map without a stale mode.
=============
*/
TravelResult VotingAdapter::PrepareForTravel()
{
	if (!injected_ || !votingComponent_)
		return TravelResult::NotInjected;
	if (!votingComponent_->IsRestartPendingByVote())
		return TravelResult::NotVoteTriggered;

	const int index = votingComponent_->SelectedIndex();
	const size_t tableSize = votingComponent_->LiveTable().size();
	if (index < 0 || static_cast<size_t>(index) >= tableSize) {
		Logf(LogLevel::Fatal, "Voting component selected row {} but its table has {} rows, game mode will not carry over.",
			index, tableSize);
		return TravelResult::HostIndexOutOfRange;
	}

	if (static_cast<size_t>(index) >= injectedModeNames_.size()) {
		Logf(LogLevel::Fatal, "Voting component selected row {} but only {} game modes were injected, game mode will not carry over.",
			index, injectedModeNames_.size());
		return TravelResult::ModeIndexOutOfRange;
	}

	const std::string& chosenName = injectedModeNames_[static_cast<size_t>(index)];
	const gamemodes::GameMode* chosen = registry_.GetInstance(chosenName);
	if (!chosen) {
		Logf(LogLevel::Fatal, "Game mode \"{}\" selected by vote is no longer configured, game mode will not carry over.",
			chosenName);
		return TravelResult::ModeNotFound;
	}

	const float difficulty = gamemodes::ResolveDifficulty(chosen->GetDifficulty());

	session::SessionCheckpoint checkpoint;
	checkpoint.isTraveling = true;
	checkpoint.targetModeName = chosen->GetName();
	checkpoint.storedDifficulty = engine_.GetDefaultDifficulty();
	checkpoints_.Write(std::move(checkpoint));

	engine_.SetDefaultDifficulty(difficulty);

	Logf(LogLevel::Info, "Traveling with game mode \"{}\" at difficulty {}.", chosen->GetName(), difficulty);
	return TravelResult::Prepared;
}

/*
=============
VotingAdapter::SetupAfterTravel

Returns the mode chosen before the map change, or nullptr when the change
was not vote-driven.
=============
*/
const gamemodes::GameMode* VotingAdapter::SetupAfterTravel()
{
	const auto checkpoint = checkpoints_.Consume();
	if (!checkpoint)
		return nullptr;

	engine_.SetDefaultDifficulty(checkpoint->storedDifficulty);

	const gamemodes::GameMode* mode = registry_.GetInstance(checkpoint->targetModeName);
	if (!mode) {
		Logf(LogLevel::Error, "Game mode \"{}\" chosen before the map change no longer exists.",
			checkpoint->targetModeName);
		return nullptr;
	}

	Logf(LogLevel::Info, "Running game mode \"{}\".", mode->GetName());
	return mode;
}

/*
=============
VotingAdapter::RestoreBackup
=============
*/
void VotingAdapter::RestoreBackup()
{
	if (!injected_ || !votingComponent_)
		return;

	votingComponent_->LiveTable() = backup_;
	votingComponent_->DefaultTable() = backup_;
	votingComponent_->SaveConfig();

	backup_.clear();
	injectedModeNames_.clear();
	votingComponent_ = nullptr;
	injected_ = false;
}

} // namespace modevote::server::voting

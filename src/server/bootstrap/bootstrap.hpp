// Copyright (c) DarkMatter Projects 2023-2025
// Licensed under the GNU General Public License 2.0.
//
// bootstrap.hpp - Per-session startup and teardown of the module.

#pragma once

#include "bootstrap_config.hpp"

#include "../features/feature_environment.hpp"
#include "../gamemodes/game_mode.hpp"
#include "../gamemodes/game_mode_registry.hpp"
#include "../host/host_engine.hpp"
#include "../session/session_checkpoint.hpp"
#include "../signals/signal_bus.hpp"
#include "../voting/voting_adapter.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace modevote::server::bootstrap {

class Bootstrap;

enum class StartResult {
	Started,
	AlreadyRunning,
};

/*
=================
BootstrapSlot

Process-lifetime record of the running Bootstrap. At most one instance may
hold it; later claims fail until the holder releases it.
=================
*/
class BootstrapSlot {
	public:
	bool Claim(const Bootstrap* instance);
	void Release(const Bootstrap* instance);
	const Bootstrap* Active() const { return active_; }

	private:
	const Bootstrap* active_ = nullptr;
};

BootstrapSlot& GetBootstrapSlot();

// Collaborators the orchestrator drives. All of them outlive the Bootstrap.
struct BootstrapServices {
	host::HostEngine& engine;
	host::PackageLoader& packages;
	features::FeatureEnvironment& features;
	gamemodes::GameModeRegistry& registry;
	session::SessionCheckpointService& checkpoints;
};

/*
=================
Bootstrap

Orchestrates one server session: leftover check, package loading, signal
redirection, game mode injection and feature enablement on Start, and the
reverse on Stop. A fresh instance is created after every map change.
=================
*/
class Bootstrap {
	public:
	Bootstrap(BootstrapConfig config, BootstrapServices services, BootstrapSlot& slot);
	~Bootstrap();

	Bootstrap(const Bootstrap&) = delete;
	Bootstrap& operator=(const Bootstrap&) = delete;

	StartResult Start();
	void Stop(bool isRestart);

	void SetNextHandler(host::TravelHandler* next) { next_ = next; }

	// Host callbacks, republished through the signal bus.
	void OnMutate(std::string_view command, int senderId);
	bool OnCheckReplacement(signals::ReplacementQuery& query);
	void OnModifyLogin(std::string& portal, std::string& options);

	bool IsRunning() const { return running_; }
	signals::SignalBus* GetSignals() { return signals_.get(); }
	const voting::VotingAdapter* GetVotingAdapter() const { return votingAdapter_.get(); }
	// Resolved through the registry on every call; nullptr when no mode was
	// carried over or it has since been removed from the config.
	const gamemodes::GameMode* GetCurrentGameMode() const;
	const std::vector<features::FeatureConfigPair>& GetEnabledFeatures() const { return enabledFeatures_; }

	private:
	void ReportLeftoverObjects() const;
	void LoadPackages();
	void SetupGameModes(std::vector<features::FeatureConfigPair>& featureArray);
	void EnableFeatures(const std::vector<features::FeatureConfigPair>& featureArray);
	void Shutdown(bool isRestart);

	BootstrapConfig config_;
	BootstrapServices services_;
	BootstrapSlot& slot_;
	host::TravelHandler* next_ = nullptr;

	std::unique_ptr<signals::SignalBus> signals_;
	std::unique_ptr<voting::VotingAdapter> votingAdapter_;
	std::string currentGameModeName_;
	std::vector<features::FeatureConfigPair> enabledFeatures_;
	bool running_ = false;
};

} // namespace modevote::server::bootstrap

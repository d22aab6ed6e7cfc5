// Copyright (c) DarkMatter Projects 2023-2025
// Licensed under the GNU General Public License 2.0.
//
// bootstrap.cpp (Session Orchestrator)
// Runs once per server session. The host destroys every session object on a
// map change, so a new Bootstrap is created for the next map and anything
// that has to survive goes through the session checkpoint service.
//
// Start order: leftover check, single-instance claim, packages, signal bus,
// game modes, features. Stop reverses what Start set up and hands control to
// the next handler in the host chain.

#include "bootstrap.hpp"

#include "../../shared/logger.hpp"
#include "../../shared/version.hpp"

#include <utility>

namespace modevote::server::bootstrap {

/*
=============
BootstrapSlot::Claim
=============
*/
bool BootstrapSlot::Claim(const Bootstrap* instance)
{
	if (active_ && active_ != instance)
		return false;

	active_ = instance;
	return true;
}

/*
=============
BootstrapSlot::Release
=============
*/
void BootstrapSlot::Release(const Bootstrap* instance)
{
	if (active_ == instance)
		active_ = nullptr;
}

/*
=============
GetBootstrapSlot
=============
*/
BootstrapSlot& GetBootstrapSlot()
{
	static BootstrapSlot slot;
	return slot;
}

/*
=============
Bootstrap::Bootstrap
=============
*/
Bootstrap::Bootstrap(BootstrapConfig config, BootstrapServices services, BootstrapSlot& slot)
	: config_(std::move(config))
	, services_(services)
	, slot_(slot) {}

/*
=============
Bootstrap::~Bootstrap
=============
*/
Bootstrap::~Bootstrap()
{
	if (running_)
		Shutdown(false);
}

/*
=============
Bootstrap::Start
=============
*/
StartResult Bootstrap::Start()
{
	ReportLeftoverObjects();

	if (!slot_.Claim(this)) {
		Log(LogLevel::Error, "Another instance is already running, refusing to start a second one.");
		return StartResult::AlreadyRunning;
	}
	if (running_)
		return StartResult::Started;

	Logf(LogLevel::Info, "Starting {} {}.", version::kModuleTitle, version::kModuleVersion);
	running_ = true;

	LoadPackages();
	signals_ = std::make_unique<signals::SignalBus>();

	std::vector<features::FeatureConfigPair> featureArray = services_.features.GetAutoConfigurationInfo();
	if (config_.useGameModes)
		SetupGameModes(featureArray);

	EnableFeatures(featureArray);
	return StartResult::Started;
}

/*
=============
Bootstrap::Stop
=============
*/
void Bootstrap::Stop(bool isRestart)
{
	if (!running_)
		return;

	Shutdown(isRestart);

	if (next_)
		next_->OnServerTraveling(isRestart);
}

/*
=============
Bootstrap::Shutdown

The adapter must record the vote before it restores the host table, since
restoring drops its row bookkeeping.
=============
*/
void Bootstrap::Shutdown(bool isRestart)
{
	Logf(LogLevel::Info, "Shutting down{}.", isRestart ? " for restart" : "");

	if (votingAdapter_) {
		if (votingAdapter_->PrepareForTravel() == voting::TravelResult::Prepared)
			Log(LogLevel::Debug, "Voted game mode recorded for the next session.");
		votingAdapter_->RestoreBackup();
		votingAdapter_.reset();
	}

	slot_.Release(this);
	services_.features.DisableAllFeatures();
	enabledFeatures_.clear();

	if (signals_) {
		signals_->Clear();
		signals_.reset();
	}

	currentGameModeName_.clear();
	running_ = false;
}

/*
=============
Bootstrap::ReportLeftoverObjects

Objects from the previous session should all be gone by now; a non-zero
count points at a leak in whatever created them.
=============
*/
void Bootstrap::ReportLeftoverObjects() const
{
	const host::ObjectCensus census = services_.engine.CountFrameworkObjects();
	if (census.Total() == 0) {
		Log(LogLevel::Info, "No leftover objects from the previous session.");
		return;
	}

	Logf(LogLevel::Warn, "Leftover objects from the previous session: {} objects, {} entities, {} records.",
		census.objects, census.entities, census.records);
}

/*
=============
Bootstrap::LoadPackages
=============
*/
void Bootstrap::LoadPackages()
{
	for (const auto& package : config_.packages) {
		if (services_.packages.LoadPackage(package))
			Logf(LogLevel::Debug, "Loaded package \"{}\".", package);
		else
			Logf(LogLevel::Error, "Failed to load package \"{}\".", package);
	}
}

/*
=============
Bootstrap::SetupGameModes

Loads the registry on first use, injects it into the voting table and picks
up the mode voted for before the last map change.
=============
*/
void Bootstrap::SetupGameModes(std::vector<features::FeatureConfigPair>& featureArray)
{
	if (services_.registry.Size() == 0 && !services_.registry.LoadFromFile(config_.gameModesFile))
		Logf(LogLevel::Warn, "No game modes could be read from '{}'.", config_.gameModesFile);

	votingAdapter_ = std::make_unique<voting::VotingAdapter>(services_.engine, services_.registry, services_.checkpoints);
	if (!votingAdapter_->Inject(services_.registry.GetNamedInstances()))
		Log(LogLevel::Warn, "Game mode voting is not active for this session.");

	const gamemodes::GameMode* mode = votingAdapter_->SetupAfterTravel();
	if (!mode)
		return;

	currentGameModeName_ = mode->GetName();
	mode->UpdateFeatureArray(featureArray);
}

/*
=============
Bootstrap::EnableFeatures
=============
*/
void Bootstrap::EnableFeatures(const std::vector<features::FeatureConfigPair>& featureArray)
{
	for (const auto& pair : featureArray) {
		if (!services_.features.EnableFeature(pair)) {
			Logf(LogLevel::Error, "Failed to enable feature \"{}\" with config \"{}\".", pair.feature, pair.config);
			continue;
		}
		enabledFeatures_.push_back(pair);
	}

	Logf(LogLevel::Info, "Enabled {} feature{}.", enabledFeatures_.size(), enabledFeatures_.size() == 1 ? "" : "s");
}

/*
=============
Bootstrap::GetCurrentGameMode
=============
*/
const gamemodes::GameMode* Bootstrap::GetCurrentGameMode() const
{
	if (currentGameModeName_.empty())
		return nullptr;
	return services_.registry.GetInstance(currentGameModeName_);
}

/*
=============
Bootstrap::OnMutate
=============
*/
void Bootstrap::OnMutate(std::string_view command, int senderId)
{
	if (signals_)
		signals_->DispatchMutate(command, senderId);
}

/*
=============
Bootstrap::OnCheckReplacement
=============
*/
bool Bootstrap::OnCheckReplacement(signals::ReplacementQuery& query)
{
	if (!signals_)
		return true;
	return signals_->DispatchCheckReplacement(query);
}

/*
=============
Bootstrap::OnModifyLogin
=============
*/
void Bootstrap::OnModifyLogin(std::string& portal, std::string& options)
{
	if (signals_)
		signals_->DispatchModifyLogin(portal, options);
}

} // namespace modevote::server::bootstrap

#pragma once

#include "server/features/feature_environment.hpp"
#include "server/host/host_engine.hpp"
#include "server/host/voting_component.hpp"
#include "shared/logger.hpp"

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

namespace modevote::tests {

/*
=============
LogCapture

Routes logger output into vectors so tests can inspect what was reported.
=============
*/
struct LogCapture {
	std::vector<std::string> printed;
	std::vector<std::string> errors;

	LogCapture()
	{
		InitLogger("test", [this](std::string_view message) {
			printed.emplace_back(message);
		}, [this](std::string_view message) {
			errors.emplace_back(message);
		});
		SetLogLevel(LogLevel::Trace);
	}

	~LogCapture()
	{
		InitLogger("test", nullptr, nullptr);
	}

	LogCapture(const LogCapture&) = delete;
	LogCapture& operator=(const LogCapture&) = delete;

	int Count(std::string_view levelTag) const
	{
		return static_cast<int>(std::count_if(printed.begin(), printed.end(), [&](const std::string& line) {
			return line.find(levelTag) != std::string::npos;
		}));
	}

	int Warnings() const { return Count("[WARN]"); }
	int Fatals() const { return Count("[FATAL]"); }

	bool Contains(std::string_view text) const
	{
		return std::any_of(printed.begin(), printed.end(), [&](const std::string& line) {
			return line.find(text) != std::string::npos;
		});
	}

	void Clear()
	{
		printed.clear();
		errors.clear();
	}
};

/*
=============
FakeVotingComponent
=============
*/
class FakeVotingComponent : public server::host::VotingComponent {
	public:
	server::host::VotingTable live;
	server::host::VotingTable defaults;
	int selectedIndex = 0;
	bool restartByVote = false;
	int saveCount = 0;

	server::host::VotingTable& LiveTable() override { return live; }
	server::host::VotingTable& DefaultTable() override { return defaults; }
	int SelectedIndex() const override { return selectedIndex; }
	bool IsRestartPendingByVote() const override { return restartByVote; }
	void SaveConfig() override { ++saveCount; }
};

/*
=============
FakeHostEngine
=============
*/
class FakeHostEngine : public server::host::HostEngine {
	public:
	FakeVotingComponent* voting = nullptr;
	float defaultDifficulty = 2.0f;
	server::host::ObjectCensus census{};

	server::host::VotingComponent* FindVotingComponent() override { return voting; }
	float GetDefaultDifficulty() const override { return defaultDifficulty; }
	void SetDefaultDifficulty(float difficulty) override { defaultDifficulty = difficulty; }
	server::host::ObjectCensus CountFrameworkObjects() const override { return census; }
};

/*
=============
FakeFeatureEnvironment
=============
*/
class FakeFeatureEnvironment : public server::features::FeatureEnvironment {
	public:
	std::vector<server::features::FeatureConfigPair> autoConfig;
	std::vector<server::features::FeatureConfigPair> enabled;
	std::vector<std::string> failing;
	int disableAllCount = 0;

	std::vector<server::features::FeatureConfigPair> GetAutoConfigurationInfo() const override { return autoConfig; }

	bool EnableFeature(const server::features::FeatureConfigPair& pair) override
	{
		if (std::find(failing.begin(), failing.end(), pair.feature) != failing.end())
			return false;
		enabled.push_back(pair);
		return true;
	}

	void DisableAllFeatures() override
	{
		enabled.clear();
		++disableAllCount;
	}
};

/*
=============
FakePackageLoader
=============
*/
class FakePackageLoader : public server::host::PackageLoader {
	public:
	std::vector<std::string> loaded;
	std::vector<std::string> missing;

	bool LoadPackage(const std::string& name) override
	{
		if (std::find(missing.begin(), missing.end(), name) != missing.end())
			return false;
		loaded.push_back(name);
		return true;
	}
};

/*
=============
FakeTravelHandler
=============
*/
class FakeTravelHandler : public server::host::TravelHandler {
	public:
	int calls = 0;
	bool lastIsRestart = false;

	void OnServerTraveling(bool isRestart) override
	{
		++calls;
		lastIsRestart = isRestart;
	}
};

/*
=============
MakeHostTable

Stock rows the host would have loaded from its own config.
=============
*/
inline server::host::VotingTable MakeHostTable()
{
	return {
		{ "KFmod.KFGameType", "Long game", "KF", "KFL", "", "GameLength=2" },
		{ "KFmod.KFGameType", "Short game", "KF", "KFS", "", "GameLength=0" },
	};
}

} // namespace modevote::tests

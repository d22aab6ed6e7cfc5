#pragma once

#include "voting_component.hpp"

#include <string>

namespace modevote::server::host {

// Still-alive framework objects, counted by kind.
struct ObjectCensus {
	int objects{};
	int entities{};
	int records{};

	int Total() const { return objects + entities + records; }
};

/*
=================
HostEngine

Session-level services supplied by the hosting game server.
=================
*/
class HostEngine {
	public:
	virtual ~HostEngine() = default;

	// Returns the live voting component, or nullptr when the host runs none.
	virtual VotingComponent* FindVotingComponent() = 0;
	virtual float GetDefaultDifficulty() const = 0;
	virtual void SetDefaultDifficulty(float difficulty) = 0;
	virtual ObjectCensus CountFrameworkObjects() const = 0;
};

/*
=================
TravelHandler

Next link in the host's shutdown chain.
=================
*/
class TravelHandler {
	public:
	virtual ~TravelHandler() = default;
	virtual void OnServerTraveling(bool isRestart) = 0;
};

/*
=================
PackageLoader
=================
*/
class PackageLoader {
	public:
	virtual ~PackageLoader() = default;
	virtual bool LoadPackage(const std::string& name) = 0;
};

} // namespace modevote::server::host

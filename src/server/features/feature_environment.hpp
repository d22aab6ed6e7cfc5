#pragma once

#include <string>
#include <vector>

namespace modevote::server::features {

// A feature to enable together with the name of the config it should use.
struct FeatureConfigPair {
	std::string feature;
	std::string config;

	bool operator==(const FeatureConfigPair&) const = default;
};

/*
=================
FeatureEnvironment

Seam over the framework's feature layer. The orchestrator asks it which
features to run for this session, enables them one by one and disables
everything again on shutdown.
=================
*/
class FeatureEnvironment {
	public:
	virtual ~FeatureEnvironment() = default;

	virtual std::vector<FeatureConfigPair> GetAutoConfigurationInfo() const = 0;
	virtual bool EnableFeature(const FeatureConfigPair& pair) = 0;
	virtual void DisableAllFeatures() = 0;
};

} // namespace modevote::server::features

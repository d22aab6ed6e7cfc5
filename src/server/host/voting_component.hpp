#pragma once

#include <string>
#include <vector>

namespace modevote::server::host {

// One row of the host's map/mode voting table.
struct VotingTableRow {
	std::string gameTypeClass;
	std::string title;
	std::string prefix;
	std::string acronym;
	std::string addons;
	std::string options;

	bool operator==(const VotingTableRow&) const = default;
};

using VotingTable = std::vector<VotingTableRow>;

/*
=================
VotingComponent

The host-owned voting mechanism. It is not owned by this module: the adapter
only reads and writes its table, reads which row the players picked and
asks it to persist its own configuration.
=================
*/
class VotingComponent {
	public:
	virtual ~VotingComponent() = default;

	// Table shown to players for the running session.
	virtual VotingTable& LiveTable() = 0;
	// Table the host writes to its own storage when saving its config.
	virtual VotingTable& DefaultTable() = 0;
	// Row chosen by the vote; meaningful once a vote has passed.
	virtual int SelectedIndex() const = 0;
	// True when the pending map change was started by a passed vote.
	virtual bool IsRestartPendingByVote() const = 0;
	virtual void SaveConfig() = 0;
};

} // namespace modevote::server::host

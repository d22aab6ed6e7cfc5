#pragma once

#include <optional>
#include <string>

namespace modevote::server::session {

/*
=================
SessionCheckpoint

State carried across a map change. Everything except isTraveling is only
meaningful while isTraveling is set.
=================
*/
struct SessionCheckpoint {
	bool isTraveling{};
	std::string targetModeName;
	float storedDifficulty{};
};

/*
=================
SessionCheckpointService

Holds the single checkpoint for the lifetime of the hosting process. The
old session writes it right before teardown and the new session consumes it
once during startup.
=================
*/
class SessionCheckpointService {
	public:
	void Write(SessionCheckpoint checkpoint);

	// Returns the checkpoint and clears it, or nullopt when nothing is
	// traveling.
	std::optional<SessionCheckpoint> Consume();

	bool IsTraveling() const { return checkpoint_.isTraveling; }
	const SessionCheckpoint& Peek() const { return checkpoint_; }
	void Reset() { checkpoint_ = {}; }

	private:
	SessionCheckpoint checkpoint_;
};

SessionCheckpointService& GetSessionCheckpointService();

} // namespace modevote::server::session

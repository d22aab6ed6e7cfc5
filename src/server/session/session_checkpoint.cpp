#include "session_checkpoint.hpp"

#include "../../shared/logger.hpp"

#include <utility>

namespace modevote::server::session {

/*
=============
SessionCheckpointService::Write
=============
*/
void SessionCheckpointService::Write(SessionCheckpoint checkpoint)
{
	if (checkpoint_.isTraveling) {
		Logf(LogLevel::Warn, "Overwriting unconsumed session checkpoint for game mode \"{}\".",
			checkpoint_.targetModeName);
	}

	checkpoint_ = std::move(checkpoint);
}

/*
=============
SessionCheckpointService::Consume
=============
*/
std::optional<SessionCheckpoint> SessionCheckpointService::Consume()
{
	if (!checkpoint_.isTraveling)
		return std::nullopt;

	SessionCheckpoint consumed = std::move(checkpoint_);
	checkpoint_ = {};
	return consumed;
}

/*
=============
GetSessionCheckpointService

Process-lifetime instance; it outlives every session object.
=============
*/
SessionCheckpointService& GetSessionCheckpointService()
{
	static SessionCheckpointService service;
	return service;
}

} // namespace modevote::server::session

#pragma once

#include "core/gameEvent.hpp"
#include "core/types.hpp"

namespace ttt {

//! Participant bound to one symbol.
//! Implementations subscribe to the bus on construction and unsubscribe on destruction.
class IPlayer {
public:
	virtual ~IPlayer() = default;

	virtual Symbol symbol() const = 0;

	//! Called for every StartTurn addressed to this player's symbol.
	virtual void onStartTurn(const StartTurn& event) = 0;
};

} // namespace ttt

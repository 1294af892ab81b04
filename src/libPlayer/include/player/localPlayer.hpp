#pragma once

#include "player/player.hpp"

#include "core/eventBus.hpp"

#include <vector>

namespace ttt {

//! Human at this machine. Turns bus events into front end notifications
//! (StartTurn -> EnableInput, InvalidMove -> InputError) and submits moves picked by the front end.
class LocalPlayer : public IPlayer {
public:
	LocalPlayer(EventBus& bus, Symbol symbol);
	~LocalPlayer() override;

	LocalPlayer(const LocalPlayer&)            = delete;
	LocalPlayer& operator=(const LocalPlayer&) = delete;

	Symbol symbol() const override;
	void onStartTurn(const StartTurn& event) override;

	//! Publish a move request for this player's symbol.
	void requestMove(Coord c);

private:
	void onInvalidMove(const InvalidMove& event);

private:
	EventBus& m_bus;
	const Symbol m_symbol;
	std::vector<SubscriptionId> m_subscriptions;
};

} // namespace ttt

#include "player/localPlayer.hpp"

namespace ttt {

LocalPlayer::LocalPlayer(EventBus& bus, const Symbol symbol) : m_bus(bus), m_symbol(symbol) {
	m_subscriptions.push_back(m_bus.subscribe<StartTurn>([this](const StartTurn& event) {
		if (event.player == m_symbol) {
			onStartTurn(event);
		}
	}));
	m_subscriptions.push_back(m_bus.subscribe<InvalidMove>([this](const InvalidMove& event) { onInvalidMove(event); }));
}

LocalPlayer::~LocalPlayer() {
	for (const auto id : m_subscriptions) {
		m_bus.unsubscribe(id);
	}
}

Symbol LocalPlayer::symbol() const {
	return m_symbol;
}

void LocalPlayer::onStartTurn(const StartTurn&) {
	m_bus.publish(EnableInput{m_symbol});
}

void LocalPlayer::requestMove(const Coord c) {
	m_bus.publish(MoveRequested{m_symbol, c});
}

void LocalPlayer::onInvalidMove(const InvalidMove& event) {
	if (event.request.player != m_symbol) {
		return;
	}
	m_bus.publish(InputError{m_symbol, event.message});
}

} // namespace ttt

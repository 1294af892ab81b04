#pragma once

#include "gameNet/handshake.hpp"
#include "gameNet/nwEvents.hpp"

#include "core/eventBus.hpp"
#include "network/channel.hpp"
#include "player/player.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <vector>

namespace ttt::gameNet {

//! Host side stand-in for the player at the other end of the channel.
//! Forwards StateUpdated, and StartTurn and InvalidMove addressed to the remote symbol, to the peer.
//! Moves received from the peer are published on the host bus as if they were local input.
class RemoteNetworkPlayer : public IPlayer {
public:
	//! Runs the role handshake on the calling thread.
	//! \param symbol Symbol of the remote player. Empty to let the peer assign it.
	RemoteNetworkPlayer(EventBus& bus, std::unique_ptr<network::Channel> channel, std::optional<Symbol> symbol,
	                    std::chrono::milliseconds handshakeTimeout = HANDSHAKE_TIMEOUT);
	~RemoteNetworkPlayer() override;

	RemoteNetworkPlayer(const RemoteNetworkPlayer&)            = delete;
	RemoteNetworkPlayer& operator=(const RemoteNetworkPlayer&) = delete;

	Symbol symbol() const override;
	void onStartTurn(const StartTurn& event) override;

	network::Channel& channel();

private:
	void onStateUpdated(const StateUpdated& event);
	void onInvalidMove(const InvalidMove& event);
	void handleMoveFrame(const network::Frame& frame);
	void send(const NwEvent& event);

private:
	EventBus& m_bus;
	std::unique_ptr<network::Channel> m_channel;
	Symbol m_symbol;
	std::vector<SubscriptionId> m_subscriptions;
};

//! Client side relay. Mirrors the events of the remote authoritative engine onto the local bus
//! and forwards local MoveRequested of its symbol to the host.
//! Nothing is relayed before start(). Frames arriving earlier stay queued on the channel.
class LocalNetworkPlayer : public IPlayer {
public:
	//! Runs the role handshake on the calling thread.
	//! \param symbol Symbol played at this side. Empty to let the host assign it.
	LocalNetworkPlayer(EventBus& bus, std::unique_ptr<network::Channel> channel, std::optional<Symbol> symbol = std::nullopt,
	                   std::chrono::milliseconds handshakeTimeout = HANDSHAKE_TIMEOUT);
	~LocalNetworkPlayer() override;

	LocalNetworkPlayer(const LocalNetworkPlayer&)            = delete;
	LocalNetworkPlayer& operator=(const LocalNetworkPlayer&) = delete;

	//! Start relaying host events. Queued frames are published on the calling thread before this returns.
	void start();

	Symbol symbol() const override;
	void onStartTurn(const StartTurn& event) override;

	network::Channel& channel();

private:
	void onMoveRequested(const MoveRequested& event);
	void onInvalidMove(const InvalidMove& event);
	void handleFrame(const network::Frame& frame);

private:
	EventBus& m_bus;
	std::unique_ptr<network::Channel> m_channel;
	Symbol m_symbol;
	std::vector<SubscriptionId> m_subscriptions;
	bool m_started{false};
};

} // namespace ttt::gameNet

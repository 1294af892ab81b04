#include "gameNet/networkPlayer.hpp"

#include "Logging.hpp"

#include "core/errors.hpp"

#include <format>
#include <string>
#include <type_traits>
#include <utility>

namespace ttt::gameNet {

//! Runs the handshake matching the constructor arguments.
static Symbol negotiate(network::Channel& channel, const std::optional<Symbol> symbol, const std::chrono::milliseconds timeout) {
	if (symbol) {
		assignRole(channel, *symbol, timeout);
		return *symbol;
	}
	return awaitRole(channel, timeout);
}

//! Publishes ConnectionLost on the bus once the channel closed.
static void reportConnectionLost(network::Channel& channel, EventBus& bus, const std::string_view tag) {
	channel.setCloseHandler([&bus, tag](const std::string& reason) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[{}] Connection lost: {}", tag, reason));
		bus.publish(ConnectionLost{reason});
	});
}

//! Sending to a closed peer is a fault for whoever caused the send.
static void sendOrThrow(network::Channel& channel, const NwEvent& event) {
	if (!channel.isOpen()) {
		throw NetworkError("Connection to the peer is closed.");
	}
	channel.send(toFrame(event));
}


RemoteNetworkPlayer::RemoteNetworkPlayer(EventBus& bus, std::unique_ptr<network::Channel> channel, const std::optional<Symbol> symbol,
                                         const std::chrono::milliseconds handshakeTimeout)
        : m_bus(bus), m_channel(std::move(channel)), m_symbol(negotiate(*m_channel, symbol, handshakeTimeout)) {
	Logger().Log(Logging::LogLevel::Info,
	             std::format("[RemoteNetworkPlayer] Peer {} plays {}.", m_channel->remoteAddress(), toString(m_symbol)));

	m_subscriptions.push_back(m_bus.subscribe<StateUpdated>([this](const StateUpdated& event) { onStateUpdated(event); }));
	m_subscriptions.push_back(m_bus.subscribe<StartTurn>([this](const StartTurn& event) {
		if (event.player == m_symbol) {
			onStartTurn(event);
		}
	}));
	m_subscriptions.push_back(m_bus.subscribe<InvalidMove>([this](const InvalidMove& event) { onInvalidMove(event); }));

	m_channel->registerHandler(std::string(MSG_MOVE_REQUESTED), [this](const network::Frame& frame) { handleMoveFrame(frame); });
	reportConnectionLost(*m_channel, m_bus, "RemoteNetworkPlayer");
}

RemoteNetworkPlayer::~RemoteNetworkPlayer() {
	m_channel->setCloseHandler(nullptr);
	m_channel->close();

	for (const auto id : m_subscriptions) {
		m_bus.unsubscribe(id);
	}
}

Symbol RemoteNetworkPlayer::symbol() const {
	return m_symbol;
}

network::Channel& RemoteNetworkPlayer::channel() {
	return *m_channel;
}

void RemoteNetworkPlayer::onStartTurn(const StartTurn& event) {
	send(event);
}

void RemoteNetworkPlayer::onStateUpdated(const StateUpdated& event) {
	send(event);
}

void RemoteNetworkPlayer::onInvalidMove(const InvalidMove& event) {
	if (event.request.player != m_symbol) {
		return;
	}
	send(event);
}

void RemoteNetworkPlayer::handleMoveFrame(const network::Frame& frame) {
	const auto event = fromFrame(frame);
	if (!event || !std::holds_alternative<MoveRequested>(*event)) {
		throw LogicError(std::format("Malformed move request: {}", frame.dump()));
	}

	const auto& move = std::get<MoveRequested>(*event);
	if (move.player != m_symbol) {
		throw LogicError(std::format("Peer playing {} requested a move for {}.", toString(m_symbol), toString(move.player)));
	}
	m_bus.publish(move);
}

void RemoteNetworkPlayer::send(const NwEvent& event) {
	sendOrThrow(*m_channel, event);
}


LocalNetworkPlayer::LocalNetworkPlayer(EventBus& bus, std::unique_ptr<network::Channel> channel, const std::optional<Symbol> symbol,
                                       const std::chrono::milliseconds handshakeTimeout)
        : m_bus(bus), m_channel(std::move(channel)), m_symbol(negotiate(*m_channel, symbol, handshakeTimeout)) {
	Logger().Log(Logging::LogLevel::Info, std::format("[LocalNetworkPlayer] Playing {} against {}.", toString(m_symbol), m_channel->remoteAddress()));

	m_subscriptions.push_back(m_bus.subscribe<StartTurn>([this](const StartTurn& event) {
		if (event.player == m_symbol) {
			onStartTurn(event);
		}
	}));
	m_subscriptions.push_back(m_bus.subscribe<MoveRequested>([this](const MoveRequested& event) { onMoveRequested(event); }));
	m_subscriptions.push_back(m_bus.subscribe<InvalidMove>([this](const InvalidMove& event) { onInvalidMove(event); }));
}

LocalNetworkPlayer::~LocalNetworkPlayer() {
	m_channel->setCloseHandler(nullptr);
	m_channel->close();

	for (const auto id : m_subscriptions) {
		m_bus.unsubscribe(id);
	}
}

void LocalNetworkPlayer::start() {
	if (m_started) {
		return;
	}
	m_started = true;

	reportConnectionLost(*m_channel, m_bus, "LocalNetworkPlayer");
	for (const auto type : {MSG_STATE_UPDATED, MSG_START_TURN, MSG_INVALID_MOVE}) {
		m_channel->registerHandler(std::string(type), [this](const network::Frame& frame) { handleFrame(frame); });
	}
}

Symbol LocalNetworkPlayer::symbol() const {
	return m_symbol;
}

network::Channel& LocalNetworkPlayer::channel() {
	return *m_channel;
}

void LocalNetworkPlayer::onStartTurn(const StartTurn&) {
	m_bus.publish(EnableInput{m_symbol});
}

void LocalNetworkPlayer::onMoveRequested(const MoveRequested& event) {
	if (event.player != m_symbol) {
		return;
	}
	sendOrThrow(*m_channel, event);
}

void LocalNetworkPlayer::onInvalidMove(const InvalidMove& event) {
	if (event.request.player != m_symbol) {
		return;
	}
	m_bus.publish(InputError{m_symbol, event.message});
}

void LocalNetworkPlayer::handleFrame(const network::Frame& frame) {
	const auto event = fromFrame(frame);
	if (!event) {
		throw LogicError(std::format("Malformed frame from host: {}", frame.dump()));
	}

	std::visit(
	        [this, &frame](auto&& ev) {
		        using Event = std::decay_t<decltype(ev)>;
		        if constexpr (std::is_same_v<Event, StateUpdated> || std::is_same_v<Event, StartTurn> || std::is_same_v<Event, InvalidMove>) {
			        m_bus.publish(ev);
		        } else {
			        throw LogicError(std::format("Unexpected frame from host: {}", frame.dump()));
		        }
	        },
	        *event);
}

} // namespace ttt::gameNet

#pragma once

#include "network/protocol.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace ttt::network {

using HandlerId    = std::uint64_t;
using FrameHandler = std::function<void(const Frame&)>;
using CloseHandler = std::function<void(const std::string& reason)>;

//! Bidirectional stream of frames over one TCP connection.
//!
//! A reader thread splits incoming bytes into frames. Frames are passed to the handlers registered
//! for their type, on the reader thread, or queued in the inbox for receive() when no handler is registered.
//! A handler throwing, a malformed or oversized frame or a read error closes the channel.
class Channel {
public:
	class Implementation;

	//! Takes over a connected socket and starts reading.
	explicit Channel(std::unique_ptr<Implementation> implementation);
	~Channel();

	Channel(const Channel&)            = delete;
	Channel& operator=(const Channel&) = delete;

	//! Send one frame. Sending on a closed channel does nothing.
	//! \note Throws LogicError for invalid frames and NetworkError when the write fails. A failed write closes the channel.
	void send(const Frame& frame);

	//! Block until a queued frame is available. Empty once the channel is closed.
	std::optional<Frame> receive();
	//! Block at most timeout. Empty on timeout or once the channel is closed.
	std::optional<Frame> receive(std::chrono::milliseconds timeout);
	std::optional<Frame> tryReceive();

	//! Register a handler for frames of one type. Frames of that type already waiting in the inbox
	//! are passed to the new handler, in order, before this returns. Frames of that type arriving
	//! meanwhile are delivered by this call too, after the queued ones, so the handler never runs twice at once.
	//! \note A throwing handler closes the channel and the exception propagates to the caller.
	HandlerId registerHandler(const std::string& type, FrameHandler handler);
	void unregisterHandler(const std::string& type, HandlerId id);

	//! Called once with the reason when the channel closes. Called right away if it already is closed.
	void setCloseHandler(CloseHandler handler);

	//! Idempotent. Sends a close frame when possible, stops the reader, drops handlers and releases blocked receivers.
	void close();
	bool isOpen() const;

	std::string remoteAddress() const; //!< "host:port" of the peer.

private:
	std::unique_ptr<Implementation> m_pimpl;
};

} // namespace ttt::network

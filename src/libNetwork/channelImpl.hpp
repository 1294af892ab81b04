#pragma once

#include "network/channel.hpp"

#include "core/SafeQueue.hpp"

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>

#include <atomic>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace ttt::network {

class Channel::Implementation {
public:
	//! \param ioContext Context the socket was created on. Kept alive for the lifetime of the socket.
	Implementation(std::unique_ptr<asio::io_context> ioContext, asio::ip::tcp::socket socket);
	~Implementation();

public:
	void start();

	void send(const Frame& frame);
	std::optional<Frame> receive();
	std::optional<Frame> receive(std::chrono::milliseconds timeout);
	std::optional<Frame> tryReceive();

	HandlerId registerHandler(const std::string& type, FrameHandler handler);
	void unregisterHandler(const std::string& type, HandlerId id);
	void setCloseHandler(CloseHandler handler);

	void close(const std::string& reason);
	bool isOpen() const;
	const std::string& remoteAddress() const;

private:
	void readLoop();
	bool processFrames(FrameBuffer& buffer); //!< Returns false when the peer asked to close.
	void dispatch(const Frame& frame);
	void replay(const std::string& type, std::vector<Frame> frames, const FrameHandler& handler);

	struct Registration {
		HandlerId id;
		FrameHandler handler;
	};

private:
	std::unique_ptr<asio::io_context> m_ioContext;
	asio::ip::tcp::socket m_socket;
	std::string m_remoteAddress;

	std::thread m_readThread;
	std::atomic<bool> m_started{false};
	std::atomic<bool> m_open{true};     //!< Cleared first when closing. Sends become no-ops.
	std::atomic<bool> m_closing{false}; //!< Close sequence runs once.
	std::mutex m_writeMutex;            //!< Keeps frames of concurrent senders apart.

	std::mutex m_handlerMutex; //!< Guards the handler table and the routing decision between handlers and inbox.
	std::unordered_map<std::string, std::vector<Registration>> m_handlers;
	std::unordered_map<std::string, std::deque<Frame>> m_backlog; //!< Frames of a type whose queued frames are being handed to a new handler.
	HandlerId m_nextHandlerId{1};
	SafeQueue<Frame> m_inbox;

	std::mutex m_closeMutex; //!< Guards close handler and reason.
	CloseHandler m_onClose;
	std::optional<std::string> m_closeReason;
};

} // namespace ttt::network

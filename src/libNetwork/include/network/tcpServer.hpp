#pragma once

#include "network/channel.hpp"
#include "network/protocol.hpp"

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>

namespace ttt::network {

//! Listening endpoint of the hosting peer. Accepts exactly one connection.
class TcpServer {
public:
	//! Bind and listen on all IPv4 interfaces. Port 0 picks a free port.
	//! \note Throws NetworkError if the port can not be bound.
	explicit TcpServer(std::uint16_t port = DEFAULT_PORT);
	~TcpServer();

	TcpServer(const TcpServer&)            = delete;
	TcpServer& operator=(const TcpServer&) = delete;

	std::uint16_t port() const; //!< Actually bound port.

	//! Wait for the peer and return a started channel. Stops listening afterwards.
	//! \note Throws NetworkError on failure or when no peer connected within timeout.
	std::unique_ptr<Channel> accept(std::optional<std::chrono::milliseconds> timeout = std::nullopt);

	void close(); //!< Stop listening.

private:
	asio::io_context m_ioContext;
	asio::ip::tcp::acceptor m_acceptor;
	std::uint16_t m_port{0};
};

} // namespace ttt::network

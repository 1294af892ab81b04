#include "network/tcpServer.hpp"

#include "Logging.hpp"
#include "channelImpl.hpp"

#include "core/errors.hpp"

#include <format>
#include <utility>

namespace ttt::network {

TcpServer::TcpServer(const std::uint16_t port) : m_ioContext(), m_acceptor(m_ioContext) {
	const asio::ip::tcp::endpoint endpoint(asio::ip::tcp::v4(), port);

	asio::error_code ec;
	m_acceptor.open(endpoint.protocol(), ec);
	if (!ec) {
		m_acceptor.set_option(asio::ip::tcp::acceptor::reuse_address(true), ec);
	}
	if (!ec) {
		m_acceptor.bind(endpoint, ec);
	}
	if (!ec) {
		m_acceptor.listen(1, ec);
	}
	if (ec) {
		asio::error_code ignored;
		m_acceptor.close(ignored);
		throw NetworkError(std::format("Could not listen on port {}: {}", port, ec.message()));
	}

	m_port = m_acceptor.local_endpoint(ec).port();
	Logger().Log(Logging::LogLevel::Info, std::format("[TcpServer] Listening on port {}.", m_port));
}

TcpServer::~TcpServer() {
	close();
}

std::uint16_t TcpServer::port() const {
	return m_port;
}

std::unique_ptr<Channel> TcpServer::accept(const std::optional<std::chrono::milliseconds> timeout) {
	if (!m_acceptor.is_open()) {
		throw NetworkError("Server is not listening.");
	}

	// The peer socket lives on its own context so the channel owns everything it uses.
	auto ioContext = std::make_unique<asio::io_context>();
	asio::ip::tcp::socket socket(*ioContext);

	std::optional<asio::error_code> result;
	m_acceptor.async_accept(socket, [&result](const asio::error_code& ec) { result = ec; });

	m_ioContext.restart();
	if (timeout) {
		m_ioContext.run_for(*timeout);
	} else {
		m_ioContext.run();
	}

	if (!result) {
		// Complete the cancelled operation before its handler state goes out of scope.
		asio::error_code ec;
		m_acceptor.cancel(ec);
		m_ioContext.restart();
		m_ioContext.run();
		throw NetworkError(std::format("No peer connected within {} ms.", timeout ? timeout->count() : 0));
	}
	if (*result) {
		throw NetworkError(std::format("Accepting a peer failed: {}", result->message()));
	}

	asio::error_code ec;
	socket.set_option(asio::ip::tcp::no_delay(true), ec);
	close();

	return std::make_unique<Channel>(std::make_unique<Channel::Implementation>(std::move(ioContext), std::move(socket)));
}

void TcpServer::close() {
	if (!m_acceptor.is_open()) {
		return;
	}

	asio::error_code ec;
	m_acceptor.close(ec);
	Logger().Log(Logging::LogLevel::Debug, std::format("[TcpServer] Stopped listening on port {}.", m_port));
}

} // namespace ttt::network

#include "network/tcpClient.hpp"

#include "Logging.hpp"
#include "channelImpl.hpp"

#include "core/errors.hpp"

#include <asio/connect.hpp>

#include <format>
#include <utility>

namespace ttt::network {

std::unique_ptr<Channel> connectToServer(const std::string& host, const std::uint16_t port, const std::optional<std::chrono::milliseconds> timeout) {
	auto ioContext = std::make_unique<asio::io_context>();

	asio::error_code ec;
	asio::ip::tcp::resolver resolver(*ioContext);
	const auto endpoints = resolver.resolve(host, std::to_string(port), ec);
	if (ec) {
		throw NetworkError(std::format("Could not resolve {}: {}", host, ec.message()));
	}

	asio::ip::tcp::socket socket(*ioContext);
	std::optional<asio::error_code> result;
	asio::async_connect(socket, endpoints, [&result](const asio::error_code& connectEc, const asio::ip::tcp::endpoint&) { result = connectEc; });

	if (timeout) {
		ioContext->run_for(*timeout);
	} else {
		ioContext->run();
	}

	if (!result) {
		socket.close(ec);
		ioContext->restart();
		ioContext->run();
		throw NetworkError(std::format("Connecting to {}:{} timed out after {} ms.", host, port, timeout ? timeout->count() : 0));
	}
	if (*result) {
		throw NetworkError(std::format("Could not connect to {}:{}: {}", host, port, result->message()));
	}

	socket.set_option(asio::ip::tcp::no_delay(true), ec);
	ioContext->restart();
	Logger().Log(Logging::LogLevel::Info, std::format("[TcpClient] Connected to {}:{}.", host, port));

	return std::make_unique<Channel>(std::make_unique<Channel::Implementation>(std::move(ioContext), std::move(socket)));
}

} // namespace ttt::network

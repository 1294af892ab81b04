#include "network/channel.hpp"

#include "Logging.hpp"
#include "channelImpl.hpp"

#include "core/errors.hpp"

#include <asio/write.hpp>

#include <array>
#include <format>
#include <iterator>
#include <utility>

namespace ttt::network {

Channel::Implementation::Implementation(std::unique_ptr<asio::io_context> ioContext, asio::ip::tcp::socket socket)
        : m_ioContext(std::move(ioContext)), m_socket(std::move(socket)) {
	asio::error_code ec;
	const auto endpoint = m_socket.remote_endpoint(ec);
	m_remoteAddress     = ec ? std::string("unknown") : std::format("{}:{}", endpoint.address().to_string(), endpoint.port());
}

Channel::Implementation::~Implementation() {
	close("Channel destroyed.");

	if (m_readThread.joinable()) {
		if (m_readThread.get_id() == std::this_thread::get_id()) {
			m_readThread.detach();
		} else {
			m_readThread.join();
		}
	}
}

void Channel::Implementation::start() {
	if (m_started.exchange(true)) {
		return;
	}

	Logger().Log(Logging::LogLevel::Info, std::format("[Channel] Connected to {}.", m_remoteAddress));
	m_readThread = std::thread(&Implementation::readLoop, this);
}

void Channel::Implementation::send(const Frame& frame) {
	const auto data = encodeFrame(frame);

	asio::error_code ec;
	{
		std::lock_guard<std::mutex> lock(m_writeMutex);
		if (!m_open) {
			return;
		}
		asio::write(m_socket, asio::buffer(data), ec);
	}

	if (ec) {
		const auto reason = std::format("Send to {} failed: {}", m_remoteAddress, ec.message());
		close(reason);
		throw NetworkError(reason);
	}
}

std::optional<Frame> Channel::Implementation::receive() {
	try {
		return m_inbox.Pop();
	} catch (const QueueReleased&) {
		return std::nullopt;
	}
}

std::optional<Frame> Channel::Implementation::receive(const std::chrono::milliseconds timeout) {
	return m_inbox.PopFor(timeout);
}

std::optional<Frame> Channel::Implementation::tryReceive() {
	return m_inbox.TryPop();
}

HandlerId Channel::Implementation::registerHandler(const std::string& type, FrameHandler handler) {
	HandlerId id = 0;
	std::vector<Frame> pending;
	{
		std::lock_guard<std::mutex> lock(m_handlerMutex);

		id = m_nextHandlerId++;
		m_handlers[type].push_back(Registration{id, handler});
		if (m_backlog.contains(type)) {
			// A running replay delivers the newer frames of this type.
			return id;
		}

		pending = m_inbox.Extract([&type](const Frame& frame) { return frameType(frame) == type; });
		if (pending.empty()) {
			return id;
		}
		// The reader parks frames of this type until the replay caught up.
		m_backlog[type];
	}

	replay(type, std::move(pending), handler);
	return id;
}

void Channel::Implementation::replay(const std::string& type, std::vector<Frame> frames, const FrameHandler& handler) {
	std::vector<FrameHandler> handlers{handler};
	try {
		while (!frames.empty()) {
			for (const auto& frame : frames) {
				for (const auto& h : handlers) {
					h(frame);
				}
			}
			frames.clear();

			std::lock_guard<std::mutex> lock(m_handlerMutex);
			const auto it = m_backlog.find(type);
			if (it == m_backlog.end()) {
				break;
			}
			if (it->second.empty()) {
				m_backlog.erase(it);
				break;
			}
			frames.assign(std::make_move_iterator(it->second.begin()), std::make_move_iterator(it->second.end()));
			it->second.clear();

			handlers.clear();
			if (const auto registered = m_handlers.find(type); registered != m_handlers.end()) {
				for (const auto& registration : registered->second) {
					handlers.push_back(registration.handler);
				}
			}
		}
	} catch (const std::exception& ex) {
		{
			std::lock_guard<std::mutex> lock(m_handlerMutex);
			m_backlog.erase(type);
		}
		close(std::format("Protocol error: {}", ex.what()));
		throw;
	}
}

void Channel::Implementation::unregisterHandler(const std::string& type, const HandlerId id) {
	std::lock_guard<std::mutex> lock(m_handlerMutex);

	const auto it = m_handlers.find(type);
	if (it == m_handlers.end()) {
		return;
	}
	std::erase_if(it->second, [id](const Registration& r) { return r.id == id; });
	if (it->second.empty()) {
		m_handlers.erase(it);
	}
}

void Channel::Implementation::setCloseHandler(CloseHandler handler) {
	std::optional<std::string> reason;
	{
		std::lock_guard<std::mutex> lock(m_closeMutex);
		if (!m_closeReason) {
			m_onClose = std::move(handler);
			return;
		}
		reason = m_closeReason;
	}

	if (handler) {
		handler(*reason);
	}
}

void Channel::Implementation::close(const std::string& reason) {
	if (m_closing.exchange(true)) {
		return;
	}

	auto logger = Logger();
	logger.Log(Logging::LogLevel::Info, std::format("[Channel] Closing connection to {}: {}", m_remoteAddress, reason));

	asio::error_code ec;
	{
		// Taking the write lock waits for a frame currently being written.
		std::lock_guard<std::mutex> lock(m_writeMutex);
		m_open = false;

		const auto closeFrame = encodeFrame(makeFrame(CLOSE_FRAME_TYPE));
		asio::write(m_socket, asio::buffer(closeFrame), ec);
		m_socket.shutdown(asio::socket_base::shutdown_send, ec);
	}

	// Unblocks the reader.
	m_socket.shutdown(asio::socket_base::shutdown_receive, ec);
	if (m_readThread.joinable() && m_readThread.get_id() != std::this_thread::get_id()) {
		m_readThread.join();
	}
	m_socket.close(ec);

	{
		std::lock_guard<std::mutex> lock(m_handlerMutex);
		m_handlers.clear();
		m_backlog.clear();
	}
	m_inbox.Release();
	m_inbox.Clear();

	CloseHandler onClose;
	{
		std::lock_guard<std::mutex> lock(m_closeMutex);
		m_closeReason = reason;
		onClose       = std::move(m_onClose);
		m_onClose     = nullptr;
	}
	if (onClose) {
		onClose(reason);
	}
}

bool Channel::Implementation::isOpen() const {
	return m_open;
}

const std::string& Channel::Implementation::remoteAddress() const {
	return m_remoteAddress;
}

void Channel::Implementation::readLoop() {
	FrameBuffer buffer;
	std::array<char, READ_CHUNK_BYTES> chunk{};
	std::string reason;

	while (true) {
		asio::error_code ec;
		const auto bytes = m_socket.read_some(asio::buffer(chunk), ec);
		if (ec) {
			reason = ec == asio::error::eof ? std::string("Peer disconnected.") : std::format("Receive failed: {}", ec.message());
			break;
		}

		buffer.append(std::string_view(chunk.data(), bytes));
		try {
			if (!processFrames(buffer)) {
				reason = "Peer closed the connection.";
				break;
			}
		} catch (const std::exception& ex) {
			reason = std::format("Protocol error: {}", ex.what());
			Logger().Log(Logging::LogLevel::Error, std::format("[Channel] {} ({})", reason, m_remoteAddress));
			break;
		}
	}

	close(reason);
}

bool Channel::Implementation::processFrames(FrameBuffer& buffer) {
	while (const auto line = buffer.next()) {
		if (!m_open) {
			return false;
		}
		if (line->empty()) {
			continue;
		}

		const auto frame = decodeFrame(*line);
		if (!frame) {
			throw LogicError(std::format("Malformed frame: {}", line->substr(0, 80)));
		}
		if (frameType(*frame) == CLOSE_FRAME_TYPE) {
			return false;
		}
		dispatch(*frame);
	}
	return m_open;
}

void Channel::Implementation::dispatch(const Frame& frame) {
	const auto type = frameType(frame);

	std::vector<FrameHandler> handlers;
	{
		std::lock_guard<std::mutex> lock(m_handlerMutex);

		if (const auto parked = m_backlog.find(type); parked != m_backlog.end()) {
			parked->second.push_back(frame);
			return;
		}
		const auto it = m_handlers.find(type);
		if (it == m_handlers.end()) {
			m_inbox.Push(frame);
			return;
		}
		for (const auto& registration : it->second) {
			handlers.push_back(registration.handler);
		}
	}

	for (const auto& handler : handlers) {
		handler(frame);
	}
}


Channel::Channel(std::unique_ptr<Implementation> implementation) : m_pimpl(std::move(implementation)) {
	m_pimpl->start();
}

Channel::~Channel() = default;

void Channel::send(const Frame& frame) {
	m_pimpl->send(frame);
}

std::optional<Frame> Channel::receive() {
	return m_pimpl->receive();
}

std::optional<Frame> Channel::receive(const std::chrono::milliseconds timeout) {
	return m_pimpl->receive(timeout);
}

std::optional<Frame> Channel::tryReceive() {
	return m_pimpl->tryReceive();
}

HandlerId Channel::registerHandler(const std::string& type, FrameHandler handler) {
	return m_pimpl->registerHandler(type, std::move(handler));
}

void Channel::unregisterHandler(const std::string& type, const HandlerId id) {
	m_pimpl->unregisterHandler(type, id);
}

void Channel::setCloseHandler(CloseHandler handler) {
	m_pimpl->setCloseHandler(std::move(handler));
}

void Channel::close() {
	m_pimpl->close("Closed locally.");
}

bool Channel::isOpen() const {
	return m_pimpl->isOpen();
}

std::string Channel::remoteAddress() const {
	return m_pimpl->remoteAddress();
}

} // namespace ttt::network

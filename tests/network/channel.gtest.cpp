#include "network/channel.hpp"
#include "network/tcpClient.hpp"
#include "network/tcpServer.hpp"

#include "core/errors.hpp"

#include "../helpers/loopback.hpp"

#include <asio/connect.hpp>
#include <asio/write.hpp>
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace ttt::gtest {

using namespace std::chrono_literals;

//! Collects frames passed to a handler and the close reason.
class FrameCollector {
public:
	network::FrameHandler handler() {
		return [this](const network::Frame& frame) {
			{
				std::lock_guard<std::mutex> lock(m_mutex);
				m_frames.push_back(frame);
			}
			m_condition.notify_all();
		};
	}
	network::CloseHandler closeHandler() {
		return [this](const std::string& reason) {
			{
				std::lock_guard<std::mutex> lock(m_mutex);
				m_closeReasons.push_back(reason);
			}
			m_condition.notify_all();
		};
	}

	bool waitForFrames(std::size_t count, std::chrono::milliseconds timeout = 5s) {
		std::unique_lock<std::mutex> lock(m_mutex);
		return m_condition.wait_for(lock, timeout, [&] { return m_frames.size() >= count; });
	}
	bool waitForClose(std::chrono::milliseconds timeout = 5s) {
		std::unique_lock<std::mutex> lock(m_mutex);
		return m_condition.wait_for(lock, timeout, [&] { return !m_closeReasons.empty(); });
	}

	std::vector<network::Frame> frames() const {
		std::lock_guard<std::mutex> lock(m_mutex);
		return m_frames;
	}
	std::vector<std::string> closeReasons() const {
		std::lock_guard<std::mutex> lock(m_mutex);
		return m_closeReasons;
	}

private:
	mutable std::mutex m_mutex;
	std::condition_variable m_condition;
	std::vector<network::Frame> m_frames;
	std::vector<std::string> m_closeReasons;
};

static network::Frame numbered(const std::string& type, int n) {
	auto frame = network::makeFrame(type);
	frame["n"] = n;
	return frame;
}

//! Plain socket for writing bytes a channel would never send.
class RawPeer {
public:
	explicit RawPeer(std::uint16_t port) : m_socket(m_ioContext) {
		m_socket.connect(asio::ip::tcp::endpoint(asio::ip::address_v4::loopback(), port));
	}
	void write(const std::string& data) {
		asio::write(m_socket, asio::buffer(data));
	}

private:
	asio::io_context m_ioContext;
	asio::ip::tcp::socket m_socket;
};

TEST(Channel, InboxKeepsOrder) {
	auto pair = connectLoopback();

	for (int i = 0; i < 3; ++i) {
		pair.client->send(numbered("Data", i));
	}

	for (int i = 0; i < 3; ++i) {
		const auto frame = pair.host->receive(5s);
		ASSERT_TRUE(frame.has_value());
		EXPECT_EQ(network::frameType(*frame), "Data");
		EXPECT_EQ((*frame)["n"], i);
	}
	EXPECT_FALSE(pair.host->tryReceive().has_value());
}

TEST(Channel, HandlerOnlyGetsItsType) {
	auto pair = connectLoopback();
	FrameCollector collector;
	pair.host->registerHandler("Ping", collector.handler());

	pair.client->send(numbered("Pong", 1));
	pair.client->send(numbered("Ping", 2));

	ASSERT_TRUE(collector.waitForFrames(1));
	EXPECT_EQ(collector.frames()[0]["n"], 2);

	const auto pong = pair.host->receive(5s);
	ASSERT_TRUE(pong.has_value());
	EXPECT_EQ(network::frameType(*pong), "Pong");
}

TEST(Channel, RegisterDrainsQueuedFrames) {
	auto pair = connectLoopback();
	FrameCollector marker;
	pair.host->registerHandler("Marker", marker.handler());

	pair.client->send(numbered("Late", 1));
	pair.client->send(numbered("Late", 2));
	pair.client->send(numbered("Marker", 3));
	ASSERT_TRUE(marker.waitForFrames(1));

	// Both Late frames were read before the marker and wait in the inbox.
	FrameCollector late;
	pair.host->registerHandler("Late", late.handler());

	const auto frames = late.frames();
	ASSERT_EQ(frames.size(), 2u);
	EXPECT_EQ(frames[0]["n"], 1);
	EXPECT_EQ(frames[1]["n"], 2);
	EXPECT_FALSE(pair.host->tryReceive().has_value());
}

TEST(Channel, LateHandlerKeepsArrivalOrder) {
	constexpr int count = 3000;
	auto pair           = connectLoopback();

	std::thread sender([&pair] {
		pair.client->send(numbered("Start", 0));
		for (int i = 0; i < count; ++i) {
			pair.client->send(numbered("Seq", i));
		}
	});

	// Seq frames keep arriving while the handler is registered.
	EXPECT_TRUE(pair.host->receive(5s).has_value());

	std::atomic<int> running{0};
	std::atomic<int> maxRunning{0};
	FrameCollector collector;
	const auto collect = collector.handler();
	pair.host->registerHandler("Seq", [&](const network::Frame& frame) {
		const int now = ++running;
		int seen      = maxRunning.load();
		while (now > seen && !maxRunning.compare_exchange_weak(seen, now)) {
		}
		collect(frame);
		--running;
	});

	sender.join();
	ASSERT_TRUE(collector.waitForFrames(count));

	const auto frames = collector.frames();
	ASSERT_EQ(frames.size(), static_cast<std::size_t>(count));
	for (int i = 0; i < count; ++i) {
		ASSERT_EQ(frames[i]["n"], i) << "at position " << i;
	}
	EXPECT_EQ(maxRunning.load(), 1);
	EXPECT_FALSE(pair.host->tryReceive().has_value());
}

TEST(Channel, ReplayedFrameExceptionClosesChannel) {
	auto pair = connectLoopback();
	FrameCollector marker;
	FrameCollector events;
	pair.host->registerHandler("Marker", marker.handler());
	pair.host->setCloseHandler(events.closeHandler());

	pair.client->send(numbered("Bad", 1));
	pair.client->send(numbered("Marker", 2));
	ASSERT_TRUE(marker.waitForFrames(1));

	EXPECT_THROW(pair.host->registerHandler("Bad", [](const network::Frame&) { throw LogicError("rejected"); }), LogicError);
	EXPECT_FALSE(pair.host->isOpen());
	ASSERT_EQ(events.closeReasons().size(), 1u);
	EXPECT_NE(events.closeReasons()[0].find("rejected"), std::string::npos);
}

TEST(Channel, UnregisteredHandlerIsNotCalled) {
	auto pair = connectLoopback();
	FrameCollector collector;
	const auto id = pair.host->registerHandler("Ping", collector.handler());
	pair.host->unregisterHandler("Ping", id);

	pair.client->send(numbered("Ping", 1));

	const auto frame = pair.host->receive(5s);
	ASSERT_TRUE(frame.has_value());
	EXPECT_TRUE(collector.frames().empty());
}

TEST(Channel, ReceiveTimesOut) {
	auto pair = connectLoopback();

	EXPECT_FALSE(pair.host->receive(50ms).has_value());
	EXPECT_TRUE(pair.host->isOpen());
}

TEST(Channel, CloseIsObservedByPeer) {
	auto pair = connectLoopback();
	FrameCollector hostEvents;
	FrameCollector clientEvents;
	pair.host->setCloseHandler(hostEvents.closeHandler());
	pair.client->setCloseHandler(clientEvents.closeHandler());

	pair.client->close();
	EXPECT_FALSE(pair.client->isOpen());
	EXPECT_EQ(clientEvents.closeReasons().size(), 1u);

	ASSERT_TRUE(hostEvents.waitForClose());
	EXPECT_FALSE(pair.host->isOpen());
	EXPECT_FALSE(pair.host->receive().has_value());

	// Sending on a closed channel does nothing.
	EXPECT_NO_THROW(pair.host->send(network::makeFrame("Late")));
	EXPECT_NO_THROW(pair.client->send(network::makeFrame("Late")));
}

TEST(Channel, CloseIsIdempotent) {
	auto pair = connectLoopback();
	FrameCollector events;
	pair.host->setCloseHandler(events.closeHandler());

	pair.host->close();
	pair.host->close();
	pair.host.reset();

	EXPECT_EQ(events.closeReasons().size(), 1u);
}

TEST(Channel, CloseHandlerSetAfterClose) {
	auto pair = connectLoopback();
	pair.host->close();

	FrameCollector events;
	pair.host->setCloseHandler(events.closeHandler());
	EXPECT_EQ(events.closeReasons().size(), 1u);
}

TEST(Channel, CloseReleasesBlockedReceiver) {
	auto pair = connectLoopback();

	std::optional<network::Frame> received = network::makeFrame("Sentinel");
	std::thread receiver([&] { received = pair.host->receive(); });

	pair.host->close();
	receiver.join();

	EXPECT_FALSE(received.has_value());
}

TEST(Channel, HandlerExceptionClosesChannel) {
	auto pair = connectLoopback();
	FrameCollector events;
	pair.host->setCloseHandler(events.closeHandler());
	pair.host->registerHandler("Bad", [](const network::Frame&) { throw LogicError("rejected"); });

	pair.client->send(network::makeFrame("Bad"));

	ASSERT_TRUE(events.waitForClose());
	EXPECT_NE(events.closeReasons()[0].find("rejected"), std::string::npos);
	EXPECT_FALSE(pair.host->isOpen());
}

TEST(Channel, MalformedFrameClosesChannel) {
	network::TcpServer server(0);
	RawPeer peer(server.port());
	auto channel = server.accept(2s);

	FrameCollector events;
	channel->setCloseHandler(events.closeHandler());
	peer.write("this is not json\n");

	ASSERT_TRUE(events.waitForClose());
	EXPECT_NE(events.closeReasons()[0].find("Malformed"), std::string::npos);
}

TEST(Channel, EmptyLinesAreIgnored) {
	network::TcpServer server(0);
	RawPeer peer(server.port());
	auto channel = server.accept(2s);

	peer.write("\n\n{\"type\":\"Data\"}\n\n");

	const auto frame = channel->receive(5s);
	ASSERT_TRUE(frame.has_value());
	EXPECT_EQ(network::frameType(*frame), "Data");
	EXPECT_TRUE(channel->isOpen());
}

TEST(Channel, ConcurrentSendersKeepFramesIntact) {
	auto pair = connectLoopback();

	std::vector<std::thread> senders;
	for (int t = 0; t < 4; ++t) {
		senders.emplace_back([&pair, t] {
			for (int i = 0; i < 50; ++i) {
				pair.client->send(numbered("Data", t * 100 + i));
			}
		});
	}
	for (auto& sender : senders) {
		sender.join();
	}

	std::vector<int> last(4, -1);
	for (int i = 0; i < 200; ++i) {
		const auto frame = pair.host->receive(5s);
		ASSERT_TRUE(frame.has_value());
		const int n = (*frame)["n"].get<int>();
		EXPECT_GT(n % 100, last[n / 100]);
		last[n / 100] = n % 100;
	}
}

TEST(TcpServer, AcceptTimesOut) {
	network::TcpServer server(0);
	EXPECT_NE(server.port(), 0u);

	EXPECT_THROW(server.accept(50ms), NetworkError);
}

TEST(TcpServer, PortInUse) {
	network::TcpServer server(0);

	EXPECT_THROW(network::TcpServer{server.port()}, NetworkError);
}

TEST(TcpClient, ConnectionRefused) {
	std::uint16_t port = 0;
	{
		network::TcpServer server(0);
		port = server.port();
	}

	EXPECT_THROW(network::connectToServer("127.0.0.1", port, 2s), NetworkError);
}

} // namespace ttt::gtest

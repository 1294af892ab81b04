#include "core/eventBus.hpp"

#include "Logging.hpp"

#include <algorithm>
#include <format>

namespace ttt {

EventBus::~EventBus() {
	shutdown();
}

SubscriptionId EventBus::addHandler(const std::type_index type, Handler handler) {
	std::lock_guard<std::mutex> lock(m_mutex);

	const auto id = m_nextId++;
	m_handlers[type].push_back(Subscription{id, std::move(handler)});
	return id;
}

void EventBus::unsubscribe(const SubscriptionId id) {
	std::lock_guard<std::mutex> lock(m_mutex);

	for (auto& [type, subscriptions] : m_handlers) {
		const auto removed = std::erase_if(subscriptions, [id](const Subscription& s) { return s.id == id; });
		if (removed != 0) {
			return;
		}
	}
}

void EventBus::clear() {
	std::lock_guard<std::mutex> lock(m_mutex);
	m_handlers.clear();
}

void EventBus::dispatch(const std::type_index type, const void* event) {
	// Handlers run without the lock so they may publish, subscribe or unsubscribe themselves.
	std::vector<Handler> snapshot;
	{
		std::lock_guard<std::mutex> lock(m_mutex);

		const auto it = m_handlers.find(type);
		if (it == m_handlers.end()) {
			return;
		}
		snapshot.reserve(it->second.size());
		for (const auto& subscription : it->second) {
			snapshot.push_back(subscription.handler);
		}
	}

	for (const auto& handler : snapshot) {
		handler(event);
	}
}

void EventBus::enqueue(std::function<void()> task) {
	std::lock_guard<std::mutex> lock(m_workerMutex);

	if (m_shutdown) {
		Logger().Log(Logging::LogLevel::Warning, "[EventBus] Asynchronous publish after shutdown dropped.");
		return;
	}

	m_asyncQueue.Push(std::move(task));
	if (!m_worker.joinable()) {
		m_worker = std::thread(&EventBus::workerLoop, this);
	}
}

void EventBus::workerLoop() {
	while (true) {
		std::function<void()> task;
		try {
			task = m_asyncQueue.Pop();
		} catch (const QueueReleased&) {
			break;
		}

		try {
			task();
		} catch (const std::exception& ex) {
			reportAsyncError(ex);
		}
	}
}

void EventBus::reportAsyncError(const std::exception& ex) {
	Logger().Log(Logging::LogLevel::Error, std::format("[EventBus] Asynchronous handler failed: {}", ex.what()));

	AsyncErrorHandler handler;
	{
		std::lock_guard<std::mutex> lock(m_errorMutex);
		handler = m_asyncErrorHandler;
	}
	if (handler) {
		handler(ex);
	}
}

void EventBus::setAsyncErrorHandler(AsyncErrorHandler handler) {
	std::lock_guard<std::mutex> lock(m_errorMutex);
	m_asyncErrorHandler = std::move(handler);
}

void EventBus::shutdown() {
	std::thread worker;
	{
		std::lock_guard<std::mutex> lock(m_workerMutex);
		if (m_shutdown) {
			return;
		}
		m_shutdown = true;
		m_asyncQueue.Release();
		worker = std::move(m_worker);
	}

	if (!worker.joinable()) {
		return;
	}
	if (worker.get_id() == std::this_thread::get_id()) {
		worker.detach();
	} else {
		worker.join();
	}
}

} // namespace ttt

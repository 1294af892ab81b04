#pragma once

#include "core/SafeQueue.hpp"

#include <atomic>
#include <cstdint>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace ttt {

using SubscriptionId = std::uint64_t;

//! Typed publish/subscribe hub connecting the engine, the players and the network bridge.
//! Handlers are keyed by the exact event type. A publish only reaches handlers subscribed at the moment it starts.
class EventBus {
public:
	using AsyncErrorHandler = std::function<void(const std::exception&)>;

	EventBus() = default;
	~EventBus();

	EventBus(const EventBus&)            = delete;
	EventBus& operator=(const EventBus&) = delete;

	template <class Event>
	SubscriptionId subscribe(std::function<void(const Event&)> handler);

	//! Unknown or already removed ids are ignored.
	void unsubscribe(SubscriptionId id);

	//! Synchronously invoke every handler of this event type, in subscription order, on the calling thread.
	//! \note Exceptions thrown by a handler propagate to the caller and skip the remaining handlers.
	template <class Event>
	void publish(const Event& event);

	//! Queue the event for delivery on the bus worker thread. Deliveries keep the order of the calls.
	//! \note Handler exceptions are logged and passed to the async error handler.
	template <class Event>
	void publishAsync(Event event);

	void setAsyncErrorHandler(AsyncErrorHandler handler);

	//! Drop all subscriptions.
	void clear();

	//! Deliver what is already queued, then stop the worker. Later asynchronous publishes are dropped.
	void shutdown();

private:
	using Handler = std::function<void(const void*)>;
	struct Subscription {
		SubscriptionId id;
		Handler handler;
	};

	SubscriptionId addHandler(std::type_index type, Handler handler);
	void dispatch(std::type_index type, const void* event);
	void enqueue(std::function<void()> task);
	void workerLoop();
	void reportAsyncError(const std::exception& ex);

private:
	mutable std::mutex m_mutex; //!< Guards the subscription table.
	std::unordered_map<std::type_index, std::vector<Subscription>> m_handlers;
	SubscriptionId m_nextId{1};

	std::mutex m_workerMutex; //!< Guards worker start and shutdown.
	std::thread m_worker;
	bool m_shutdown{false};
	SafeQueue<std::function<void()>> m_asyncQueue;

	std::mutex m_errorMutex;
	AsyncErrorHandler m_asyncErrorHandler;
};


template <class Event>
SubscriptionId EventBus::subscribe(std::function<void(const Event&)> handler) {
	return addHandler(typeid(Event), [handler = std::move(handler)](const void* event) { handler(*static_cast<const Event*>(event)); });
}

template <class Event>
void EventBus::publish(const Event& event) {
	dispatch(typeid(Event), &event);
}

template <class Event>
void EventBus::publishAsync(Event event) {
	enqueue([this, event = std::move(event)] { publish(event); });
}

} // namespace ttt

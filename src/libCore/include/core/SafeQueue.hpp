#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <vector>

namespace ttt {

//! Thrown by SafeQueue::Pop when the queue was released and nothing is left.
class QueueReleased : public std::runtime_error {
public:
	QueueReleased() : std::runtime_error("Queue released.") {}
};

//! Thread safe queue with blocking and timed Pop functions.
template <class Entry>
class SafeQueue {
public:
	SafeQueue();

	//! Push element onto the queue.
	void Push(Entry value);

	//! Thread blocks here until there is an element to receive.
	//! \note Throws QueueReleased when the queue is empty and blocking for threads is disabled.
	Entry Pop();

	//! Blocks at most timeout. Empty on timeout or when released and empty.
	std::optional<Entry> PopFor(std::chrono::milliseconds timeout);

	//! Never blocks.
	std::optional<Entry> TryPop();

	//! Removes and returns, in order, all entries matching the predicate.
	template <class Predicate>
	std::vector<Entry> Extract(Predicate predicate);

	//! Returns true if the queue is empty; false otherwise.
	bool Empty() const;

	void Clear();

	//! Stop blocking the threads trying to pop an element from the queue.
	void Release();
	bool Released() const;

protected:
	std::deque<Entry> m_queue;           //!< Stores the entries.
	mutable std::mutex m_mutex;          //!< Manage access to the queue.
	std::condition_variable m_condition; //!< Notify that element can be popped.
	std::atomic<bool> m_blockThreads;    //!< Should the Pop function block the threads or not.
};


template <class Entry>
SafeQueue<Entry>::SafeQueue() : m_blockThreads(true){};

template <class Entry>
void SafeQueue<Entry>::Push(Entry value) {
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		m_queue.push_back(std::move(value));
	}
	m_condition.notify_one();
}

template <class Entry>
Entry SafeQueue<Entry>::Pop() {
	std::unique_lock<std::mutex> lock(m_mutex);
	m_condition.wait(lock, [this] { return !(m_queue.empty() && m_blockThreads); });

	if (m_queue.empty()) {
		throw QueueReleased();
	}
	Entry element = std::move(m_queue.front());
	m_queue.pop_front();

	return element;
}

template <class Entry>
std::optional<Entry> SafeQueue<Entry>::PopFor(const std::chrono::milliseconds timeout) {
	std::unique_lock<std::mutex> lock(m_mutex);
	m_condition.wait_for(lock, timeout, [this] { return !(m_queue.empty() && m_blockThreads); });

	if (m_queue.empty()) {
		return std::nullopt;
	}
	std::optional<Entry> element{std::move(m_queue.front())};
	m_queue.pop_front();

	return element;
}

template <class Entry>
std::optional<Entry> SafeQueue<Entry>::TryPop() {
	std::lock_guard<std::mutex> lock(m_mutex);
	if (m_queue.empty()) {
		return std::nullopt;
	}
	std::optional<Entry> element{std::move(m_queue.front())};
	m_queue.pop_front();

	return element;
}

template <class Entry>
template <class Predicate>
std::vector<Entry> SafeQueue<Entry>::Extract(Predicate predicate) {
	std::vector<Entry> extracted;

	std::lock_guard<std::mutex> lock(m_mutex);
	for (auto it = m_queue.begin(); it != m_queue.end();) {
		if (predicate(*it)) {
			extracted.push_back(std::move(*it));
			it = m_queue.erase(it);
		} else {
			++it;
		}
	}
	return extracted;
}

template <class Entry>
bool SafeQueue<Entry>::Empty() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_queue.empty();
}

template <class Entry>
void SafeQueue<Entry>::Clear() {
	std::lock_guard<std::mutex> lock(m_mutex);
	m_queue.clear();
}

template <class Entry>
void SafeQueue<Entry>::Release() {
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		m_blockThreads.store(false);
	}
	m_condition.notify_all();
}

template <class Entry>
bool SafeQueue<Entry>::Released() const {
	return !m_blockThreads.load();
}

} // namespace ttt

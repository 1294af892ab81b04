#pragma once

#include "core/board.hpp"
#include "core/eventBus.hpp"
#include "core/gameEvent.hpp"

#include <chrono>
#include <condition_variable>
#include <format>
#include <mutex>
#include <string>
#include <vector>

namespace ttt::gtest {

//! Records the game events published on a bus. Handlers may run on any thread.
class EventRecorder {
public:
	explicit EventRecorder(EventBus& bus) : m_bus(bus) {
		m_subscriptions.push_back(m_bus.subscribe<StateUpdated>([this](const StateUpdated& e) {
			record([&] {
				m_states.push_back(e);
				m_sequence.push_back("StateUpdated");
			});
		}));
		m_subscriptions.push_back(m_bus.subscribe<StartTurn>([this](const StartTurn& e) {
			record([&] {
				m_turns.push_back(e);
				m_sequence.push_back(std::format("StartTurn:{}", toString(e.player)));
			});
		}));
		m_subscriptions.push_back(m_bus.subscribe<InvalidMove>([this](const InvalidMove& e) {
			record([&] {
				m_invalidMoves.push_back(e);
				m_sequence.push_back(std::format("InvalidMove:{}", toString(e.error)));
			});
		}));
		m_subscriptions.push_back(m_bus.subscribe<EnableInput>([this](const EnableInput& e) {
			record([&] {
				m_enableInputs.push_back(e);
				m_sequence.push_back(std::format("EnableInput:{}", toString(e.player)));
			});
		}));
		m_subscriptions.push_back(m_bus.subscribe<InputError>([this](const InputError& e) {
			record([&] {
				m_inputErrors.push_back(e);
				m_sequence.push_back(std::format("InputError:{}", toString(e.player)));
			});
		}));
		m_subscriptions.push_back(m_bus.subscribe<ConnectionLost>([this](const ConnectionLost& e) {
			record([&] {
				m_connectionLost.push_back(e);
				m_sequence.push_back("ConnectionLost");
			});
		}));
	}
	~EventRecorder() {
		for (const auto id : m_subscriptions) {
			m_bus.unsubscribe(id);
		}
	}

	std::vector<StateUpdated> states() const {
		std::lock_guard<std::mutex> lock(m_mutex);
		return m_states;
	}
	std::vector<StartTurn> turns() const {
		std::lock_guard<std::mutex> lock(m_mutex);
		return m_turns;
	}
	std::vector<InvalidMove> invalidMoves() const {
		std::lock_guard<std::mutex> lock(m_mutex);
		return m_invalidMoves;
	}
	std::vector<EnableInput> enableInputs() const {
		std::lock_guard<std::mutex> lock(m_mutex);
		return m_enableInputs;
	}
	std::vector<InputError> inputErrors() const {
		std::lock_guard<std::mutex> lock(m_mutex);
		return m_inputErrors;
	}
	std::vector<ConnectionLost> connectionLosses() const {
		std::lock_guard<std::mutex> lock(m_mutex);
		return m_connectionLost;
	}
	std::vector<std::string> sequence() const {
		std::lock_guard<std::mutex> lock(m_mutex);
		return m_sequence;
	}

	bool waitForStates(std::size_t count, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
		return waitUntil([&] { return m_states.size() >= count; }, timeout);
	}
	bool waitForEnableInputs(std::size_t count, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
		return waitUntil([&] { return m_enableInputs.size() >= count; }, timeout);
	}
	bool waitForInputErrors(std::size_t count, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
		return waitUntil([&] { return m_inputErrors.size() >= count; }, timeout);
	}
	bool waitForConnectionLost(std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
		return waitUntil([&] { return !m_connectionLost.empty(); }, timeout);
	}
	//! Waits for a StateUpdated with a winner or a full board.
	bool waitForGameOver(std::chrono::milliseconds timeout = std::chrono::seconds(10)) {
		return waitUntil(
		        [&] {
			        if (m_states.empty()) {
				        return false;
			        }
			        const auto& last = m_states.back();
			        return last.winner.has_value() || Board(last.board).isFull();
		        },
		        timeout);
	}

private:
	template <class Action>
	void record(Action action) {
		{
			std::lock_guard<std::mutex> lock(m_mutex);
			action();
		}
		m_condition.notify_all();
	}

	template <class Predicate>
	bool waitUntil(Predicate predicate, std::chrono::milliseconds timeout) {
		std::unique_lock<std::mutex> lock(m_mutex);
		return m_condition.wait_for(lock, timeout, predicate);
	}

private:
	EventBus& m_bus;
	std::vector<SubscriptionId> m_subscriptions;

	mutable std::mutex m_mutex;
	std::condition_variable m_condition;
	std::vector<StateUpdated> m_states;
	std::vector<StartTurn> m_turns;
	std::vector<InvalidMove> m_invalidMoves;
	std::vector<EnableInput> m_enableInputs;
	std::vector<InputError> m_inputErrors;
	std::vector<ConnectionLost> m_connectionLost;
	std::vector<std::string> m_sequence;
};

} // namespace ttt::gtest

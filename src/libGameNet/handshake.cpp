#include "gameNet/handshake.hpp"
#include "gameNet/nwEvents.hpp"

#include "Logging.hpp"

#include "core/errors.hpp"

#include <condition_variable>
#include <format>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace ttt::gameNet {

void assignRole(network::Channel& channel, const Symbol role, const std::chrono::milliseconds timeout) {
	channel.send(toFrame(NwAssignRole{role}));

	const auto reply = channel.receive(timeout);
	if (!reply) {
		throw NetworkError(channel.isOpen() ? std::format("Role assignment not acknowledged within {} ms.", timeout.count())
		                                    : std::string("Connection closed during role assignment."));
	}

	const auto event = fromFrame(*reply);
	if (!event || !std::holds_alternative<NwAssignRoleAck>(*event)) {
		channel.close();
		throw LogicError(std::format("Unexpected frame during role assignment: {}", reply->dump()));
	}

	Logger().Log(Logging::LogLevel::Info, std::format("[Handshake] Peer acknowledged role {}.", toString(role)));
}

Symbol awaitRole(network::Channel& channel, const std::chrono::milliseconds timeout) {
	// Shared with the handler, which may still run on the reader thread after a timeout.
	struct State {
		std::mutex mutex;
		std::condition_variable condition;
		std::optional<Symbol> role;
		std::optional<std::string> failure;
		bool closed{false};
	};
	auto state = std::make_shared<State>();

	const auto handlerId = channel.registerHandler(std::string(MSG_ASSIGN_ROLE), [state](const network::Frame& frame) {
		const auto event = fromFrame(frame);
		{
			std::lock_guard<std::mutex> lock(state->mutex);
			if (state->role || state->failure) {
				return;
			}
			if (event && std::holds_alternative<NwAssignRole>(*event)) {
				state->role = std::get<NwAssignRole>(*event).role;
			} else {
				state->failure = frame.dump();
			}
		}
		state->condition.notify_all();
	});
	channel.setCloseHandler([state](const std::string&) {
		{
			std::lock_guard<std::mutex> lock(state->mutex);
			state->closed = true;
		}
		state->condition.notify_all();
	});

	std::unique_lock<std::mutex> lock(state->mutex);
	state->condition.wait_for(lock, timeout, [&state] { return state->role || state->failure || state->closed; });
	const auto role    = state->role;
	const auto failure = state->failure;
	const bool closed  = state->closed;
	lock.unlock();

	channel.unregisterHandler(std::string(MSG_ASSIGN_ROLE), handlerId);
	channel.setCloseHandler(nullptr);

	if (failure) {
		channel.close();
		throw LogicError(std::format("Malformed role assignment: {}", *failure));
	}
	if (!role) {
		throw NetworkError(closed ? std::string("Connection closed before a role was assigned.")
		                          : std::format("No role assigned within {} ms.", timeout.count()));
	}

	channel.send(toFrame(NwAssignRoleAck{}));
	Logger().Log(Logging::LogLevel::Info, std::format("[Handshake] Assigned role {}.", toString(*role)));
	return *role;
}

} // namespace ttt::gameNet

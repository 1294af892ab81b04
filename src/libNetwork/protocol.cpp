#include "network/protocol.hpp"

#include "core/errors.hpp"

#include <format>

namespace ttt::network {

Frame makeFrame(const std::string_view type) {
	return Frame{{TYPE_KEY, std::string(type)}};
}

std::string frameType(const Frame& frame) {
	return frame.at(TYPE_KEY).get<std::string>();
}

bool isValidFrame(const Frame& frame) {
	if (!frame.is_object()) {
		return false;
	}
	const auto it = frame.find(TYPE_KEY);
	return it != frame.end() && it->is_string();
}

std::string encodeFrame(const Frame& frame) {
	if (!isValidFrame(frame)) {
		throw LogicError("Frame must be a JSON object with a string type.");
	}

	std::string text;
	try {
		text = frame.dump();
	} catch (const nlohmann::json::exception& ex) {
		throw LogicError(std::format("Frame can not be serialized: {}", ex.what()));
	}

	if (text.size() > MAX_FRAME_BYTES) {
		throw LogicError(std::format("Frame of {} bytes exceeds the limit of {} bytes.", text.size(), MAX_FRAME_BYTES));
	}
	text.push_back(FRAME_DELIMITER);
	return text;
}

std::optional<Frame> decodeFrame(const std::string_view line) {
	auto frame = Frame::parse(line, nullptr, false);
	if (frame.is_discarded() || !isValidFrame(frame)) {
		return std::nullopt;
	}
	return frame;
}

void FrameBuffer::append(const std::string_view data) {
	m_buffer.append(data);
}

std::optional<std::string> FrameBuffer::next() {
	const auto pos = m_buffer.find(FRAME_DELIMITER);
	if (pos == std::string::npos) {
		if (m_buffer.size() > MAX_FRAME_BYTES) {
			throw LogicError(std::format("Incomplete frame exceeds the limit of {} bytes.", MAX_FRAME_BYTES));
		}
		return std::nullopt;
	}
	if (pos > MAX_FRAME_BYTES) {
		throw LogicError(std::format("Frame of {} bytes exceeds the limit of {} bytes.", pos, MAX_FRAME_BYTES));
	}

	std::string line = m_buffer.substr(0, pos);
	m_buffer.erase(0, pos + 1);
	return line;
}

std::size_t FrameBuffer::pending() const {
	return m_buffer.size();
}

} // namespace ttt::network

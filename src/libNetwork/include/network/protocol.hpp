#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace ttt::network {

//! One message on the wire: a JSON object carrying a string "type" field.
using Frame = nlohmann::json;

inline constexpr std::uint16_t DEFAULT_PORT    = 9000;
inline constexpr char FRAME_DELIMITER          = '\n';
inline constexpr std::size_t MAX_FRAME_BYTES   = 64 * 1024; //!< Longest accepted line, delimiter excluded.
inline constexpr std::size_t READ_CHUNK_BYTES  = 4 * 1024;
inline constexpr const char* TYPE_KEY          = "type";
inline constexpr std::string_view CLOSE_FRAME_TYPE = "__close__"; //!< Reserved. Announces an orderly shutdown.

//! Frame with only the type field set.
Frame makeFrame(std::string_view type);

//! Returns the type field. Assumes the frame is valid.
std::string frameType(const Frame& frame);

//! Returns whether the frame is an object with a string type field.
bool isValidFrame(const Frame& frame);

//! Compact JSON text followed by the delimiter.
//! \note Throws LogicError for invalid, unserializable or oversized frames.
std::string encodeFrame(const Frame& frame);

//! Parse one line without its delimiter. Empty if the line is not valid JSON or not a valid frame.
std::optional<Frame> decodeFrame(std::string_view line);

//! Accumulates received bytes and splits them into delimited lines.
class FrameBuffer {
public:
	void append(std::string_view data);

	//! Next complete line without its delimiter. Empty until a delimiter was received.
	//! \note Throws LogicError when a line grows beyond MAX_FRAME_BYTES.
	std::optional<std::string> next();

	std::size_t pending() const; //!< Bytes of the incomplete line.

private:
	std::string m_buffer;
};

} // namespace ttt::network

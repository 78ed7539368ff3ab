#pragma once

#include <mcp_relay/core/result.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace mcp_relay {

// ---------------------------------------------------------------------------
// RFC 6455 framing and opening handshake. Transport-free: frames are read
// through a ByteReader so the codec can be exercised from a buffer.
// ---------------------------------------------------------------------------

enum class WsOpcode : uint8_t {
    Continuation = 0x0,
    Text = 0x1,
    Binary = 0x2,
    Close = 0x8,
    Ping = 0x9,
    Pong = 0xA,
};

inline constexpr size_t kMaxWsPayloadBytes = 4 * 1024 * 1024;
inline constexpr size_t kMaxWsHandshakeBytes = 8 * 1024;

struct WsFrame {
    WsOpcode opcode = WsOpcode::Text;
    std::string payload;
};

// Fills exactly `size` bytes or returns false (peer gone).
using ByteReader = std::function<bool(uint8_t* data, size_t size)>;

// Read one client frame. Client frames must be masked and final.
// A false read before the first byte is ConnectionClosed, anything
// else malformed is MalformedMessage.
[[nodiscard]] Result<WsFrame, Error> ReadFrame(const ByteReader& read);

// Encode one final frame. Server frames are unmasked; a mask is only
// given when acting as a client (tests).
[[nodiscard]] std::string EncodeFrame(WsOpcode opcode, std::string_view payload,
                                      std::optional<std::array<uint8_t, 4>> mask = std::nullopt);

// base64(SHA-1(key + GUID)).
[[nodiscard]] std::string ComputeAcceptKey(const std::string& client_key);

struct WsHandshakeRequest {
    std::string method;
    std::string path;  // without query
    std::map<std::string, std::string> headers;  // lower-case names

    [[nodiscard]] std::string Header(const std::string& lower_name) const;
};

// Parse the HTTP upgrade request up to the blank line and check the
// mandatory upgrade headers.
[[nodiscard]] Result<WsHandshakeRequest, Error> ParseHandshakeRequest(std::string_view request);

[[nodiscard]] std::string BuildHandshakeResponse(const std::string& client_key);

// Minimal HTTP error response used to refuse a handshake.
[[nodiscard]] std::string BuildHttpError(int status, const std::string& reason,
                                         const std::string& body);

} // namespace mcp_relay

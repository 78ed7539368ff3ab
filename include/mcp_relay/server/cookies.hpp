#pragma once

#include <mcp_relay/core/result.hpp>

#include <optional>
#include <string>

namespace mcp_relay {

// Session id carried by cookie `cookie_name` in a Cookie request header.
// Missing header: "Missing cookie in request". Header without the cookie:
// "Missing user-cookie in request". Both are UnknownSession errors (400).
// The value is percent-decoded.
[[nodiscard]] Result<std::string, Error> ExtractSessionId(
    const std::optional<std::string>& cookie_header,
    const std::string& cookie_name);

// "<name>=<percent-encoded id>", the header value the internal client sends.
[[nodiscard]] std::string MakeSessionCookie(const std::string& cookie_name,
                                            const std::string& session_id);

} // namespace mcp_relay

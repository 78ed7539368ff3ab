#pragma once

#include <mcp_relay/core/result.hpp>

#include <cstdint>
#include <string>

namespace mcp_relay {

// ---------------------------------------------------------------------------
// HttpUrl — the parts of an http:// or https:// URL the clients need.
// ---------------------------------------------------------------------------
struct HttpUrl {
    std::string scheme = "http";
    std::string host;
    uint16_t port = 80;
    std::string path = "/";  // always starts with '/'

    // scheme://host:port (no path)
    [[nodiscard]] std::string Origin() const;
    [[nodiscard]] std::string ToString() const { return Origin() + path; }
};

Result<HttpUrl, Error> ParseHttpUrl(const std::string& url);

// Join a base path and a relative path with exactly one '/' between them.
std::string JoinPath(const std::string& base, const std::string& path);

// Percent-encode a string per RFC 3986.
std::string UrlEncode(const std::string& value);

// Decode %XX escapes; '+' is kept as is. Invalid escapes are copied verbatim.
std::string UrlDecode(const std::string& value);

} // namespace mcp_relay

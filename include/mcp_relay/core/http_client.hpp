#pragma once

#include <mcp_relay/core/result.hpp>
#include <mcp_relay/core/url.hpp>

#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace mcp_relay {

// ---------------------------------------------------------------------------
// HttpHeaders — header name to value. Names are case-sensitive here;
// callers normalise as needed.
// ---------------------------------------------------------------------------
using HttpHeaders = std::map<std::string, std::string>;

struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::string body;
};

// ---------------------------------------------------------------------------
// IHttpClient — outbound HTTP, bound to one origin.
//
// The internal MCP client and the chat backend depend on this interface
// rather than on cpp-httplib, so they can be tested offline with
// MockHttpClient. Transport failures are returned as Error, HTTP error
// statuses as a normal HttpResponse.
// ---------------------------------------------------------------------------
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    IHttpClient(const IHttpClient&) = delete;
    IHttpClient& operator=(const IHttpClient&) = delete;
    IHttpClient(IHttpClient&&) = delete;
    IHttpClient& operator=(IHttpClient&&) = delete;

    [[nodiscard]] virtual Result<HttpResponse, Error> Get(
        std::string_view path,
        const HttpHeaders& headers = {}) = 0;

    [[nodiscard]] virtual Result<HttpResponse, Error> Post(
        std::string_view path,
        std::string_view body,
        std::string_view content_type,
        const HttpHeaders& headers = {}) = 0;

    // scheme://host:port of the remote side.
    [[nodiscard]] virtual std::string Origin() const = 0;

protected:
    IHttpClient() = default;
};

struct HttpClientOptions {
    int connect_timeout_seconds = 5;
    int read_timeout_seconds = 120;
    int write_timeout_seconds = 30;
};

// ---------------------------------------------------------------------------
// HttpClient — IHttpClient over cpp-httplib.
// ---------------------------------------------------------------------------
class HttpClient : public IHttpClient {
public:
    explicit HttpClient(const HttpUrl& origin, HttpClientOptions options = {});
    ~HttpClient() override;

    [[nodiscard]] Result<HttpResponse, Error> Get(
        std::string_view path,
        const HttpHeaders& headers = {}) override;

    [[nodiscard]] Result<HttpResponse, Error> Post(
        std::string_view path,
        std::string_view body,
        std::string_view content_type,
        const HttpHeaders& headers = {}) override;

    [[nodiscard]] std::string Origin() const override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace mcp_relay

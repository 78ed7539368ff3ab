#include <mcp_relay/core/http_client.hpp>

#include <mcp_relay/core/log.hpp>

#include <httplib.h>

#include <mutex>

namespace mcp_relay {

namespace {

constexpr size_t kMaxBodyLog = 512;

ErrorCategory CategoryFromHttpTransportError(httplib::Error error) {
    switch (error) {
        case httplib::Error::Timeout:
        case httplib::Error::ConnectionTimeout:
        case httplib::Error::Read:
            return ErrorCategory::TimedOut;
        default:
            return ErrorCategory::Upstream;
    }
}

HttpHeaders ToHttpHeaders(const httplib::Headers& hdrs) {
    HttpHeaders result;
    for (const auto& [key, value] : hdrs) {
        result[key] = value;
    }
    return result;
}

httplib::Headers ToHttplibHeaders(const HttpHeaders& hdrs) {
    httplib::Headers result;
    for (const auto& [key, value] : hdrs) {
        result.emplace(key, value);
    }
    return result;
}

void LogResponse(int status, const std::string& body) {
    LogDebug("http", "  < " + std::to_string(status));
    if (body.empty()) {
        return;
    }
    if (body.size() <= kMaxBodyLog) {
        LogDebug("http", "  < body: " + body);
    } else {
        LogDebug("http", "  < body: " + body.substr(0, kMaxBodyLog) + "... (truncated)");
    }
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Impl — pimpl body holding the httplib::Client.
// httplib::Client is not safe for concurrent requests; calls are serialized.
// ---------------------------------------------------------------------------
struct HttpClient::Impl {
    HttpUrl origin;
    std::unique_ptr<httplib::Client> client;
    std::mutex mutex;

    Impl(const HttpUrl& url, const HttpClientOptions& opts) : origin(url) {
        origin.path = "/";
        client = std::make_unique<httplib::Client>(origin.Origin());
        client->set_connection_timeout(opts.connect_timeout_seconds);
        client->set_read_timeout(opts.read_timeout_seconds);
        client->set_write_timeout(opts.write_timeout_seconds);
    }

    Result<HttpResponse, Error> Failed(const char* operation,
                                       std::string_view path,
                                       httplib::Error http_error) const {
        auto error = Error::Make(CategoryFromHttpTransportError(http_error),
                                 operation,
                                 "HTTP request failed: " + httplib::to_string(http_error));
        error.endpoint = origin.Origin() + std::string(path);
        return Result<HttpResponse, Error>::Err(std::move(error));
    }

    Result<HttpResponse, Error> DoGet(std::string_view path,
                                      const HttpHeaders& headers) {
        std::lock_guard<std::mutex> lock(mutex);
        LogInfo("http", "GET " + origin.Origin() + std::string(path));
        auto res = client->Get(std::string(path), ToHttplibHeaders(headers));
        if (!res) {
            return Failed("Get", path, res.error());
        }
        LogResponse(res->status, res->body);
        return Result<HttpResponse, Error>::Ok(HttpResponse{
            res->status, ToHttpHeaders(res->headers), res->body});
    }

    Result<HttpResponse, Error> DoPost(std::string_view path,
                                       std::string_view body,
                                       std::string_view content_type,
                                       const HttpHeaders& headers) {
        std::lock_guard<std::mutex> lock(mutex);
        LogInfo("http", "POST " + origin.Origin() + std::string(path));
        auto res = client->Post(std::string(path), ToHttplibHeaders(headers),
                                std::string(body), std::string(content_type));
        if (!res) {
            return Failed("Post", path, res.error());
        }
        LogResponse(res->status, res->body);
        return Result<HttpResponse, Error>::Ok(HttpResponse{
            res->status, ToHttpHeaders(res->headers), res->body});
    }
};

HttpClient::HttpClient(const HttpUrl& origin, HttpClientOptions options)
    : impl_(std::make_unique<Impl>(origin, options)) {}

HttpClient::~HttpClient() = default;

Result<HttpResponse, Error> HttpClient::Get(std::string_view path,
                                            const HttpHeaders& headers) {
    return impl_->DoGet(path, headers);
}

Result<HttpResponse, Error> HttpClient::Post(std::string_view path,
                                             std::string_view body,
                                             std::string_view content_type,
                                             const HttpHeaders& headers) {
    return impl_->DoPost(path, body, content_type, headers);
}

std::string HttpClient::Origin() const {
    return impl_->origin.Origin();
}

} // namespace mcp_relay

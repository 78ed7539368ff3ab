#pragma once

#include <mcp_relay/core/http_client.hpp>

#include <deque>
#include <string>
#include <vector>

namespace mcp_relay {
namespace testing {

// ---------------------------------------------------------------------------
// MockHttpClient — hand-written IHttpClient double.
//
// Usage:
//   MockHttpClient mock;
//   mock.EnqueuePost(Result<HttpResponse, Error>::Ok({200, {}, "{}"}));
//   auto result = mock.Post("/mcp/", body, "application/json");
//   CHECK(mock.PostCalls()[0].path == "/mcp/");
//
// Responses are consumed FIFO. An empty queue yields an Internal error.
// ---------------------------------------------------------------------------

struct HttpGetCall {
    std::string path;
    HttpHeaders headers;
};

struct HttpPostCall {
    std::string path;
    std::string body;
    std::string content_type;
    HttpHeaders headers;
};

class MockHttpClient : public IHttpClient {
public:
    explicit MockHttpClient(std::string origin = "http://127.0.0.1:8090")
        : origin_(std::move(origin)) {}

    void EnqueueGet(Result<HttpResponse, Error> response) {
        get_responses_.push_back(std::move(response));
    }

    void EnqueuePost(Result<HttpResponse, Error> response) {
        post_responses_.push_back(std::move(response));
    }

    // Shorthand for a successful POST answer.
    void EnqueuePostOk(int status, std::string body) {
        HttpResponse response;
        response.status_code = status;
        response.body = std::move(body);
        post_responses_.push_back(Result<HttpResponse, Error>::Ok(std::move(response)));
    }

    [[nodiscard]] const std::vector<HttpGetCall>& GetCalls() const noexcept {
        return get_calls_;
    }
    [[nodiscard]] const std::vector<HttpPostCall>& PostCalls() const noexcept {
        return post_calls_;
    }
    [[nodiscard]] size_t PostCallCount() const noexcept {
        return post_calls_.size();
    }

    Result<HttpResponse, Error> Get(std::string_view path,
                                    const HttpHeaders& headers) override {
        get_calls_.push_back({std::string(path), headers});
        return Dequeue(get_responses_, path);
    }

    Result<HttpResponse, Error> Post(std::string_view path,
                                     std::string_view body,
                                     std::string_view content_type,
                                     const HttpHeaders& headers) override {
        post_calls_.push_back({
            std::string(path),
            std::string(body),
            std::string(content_type),
            headers,
        });
        return Dequeue(post_responses_, path);
    }

    [[nodiscard]] std::string Origin() const override { return origin_; }

private:
    static Result<HttpResponse, Error> Dequeue(
        std::deque<Result<HttpResponse, Error>>& queue, std::string_view path) {
        if (queue.empty()) {
            return Result<HttpResponse, Error>::Err(Error::Make(
                ErrorCategory::Internal, "MockHttpClient",
                "No canned response for " + std::string(path)));
        }
        auto response = std::move(queue.front());
        queue.pop_front();
        return response;
    }

    std::string origin_;
    std::deque<Result<HttpResponse, Error>> get_responses_;
    std::deque<Result<HttpResponse, Error>> post_responses_;
    std::vector<HttpGetCall> get_calls_;
    std::vector<HttpPostCall> post_calls_;
};

} // namespace testing
} // namespace mcp_relay

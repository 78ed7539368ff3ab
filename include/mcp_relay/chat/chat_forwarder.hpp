#pragma once

#include <mcp_relay/core/http_client.hpp>
#include <mcp_relay/core/result.hpp>
#include <mcp_relay/mcp/mcp_http_client.hpp>

#include <memory>
#include <string>

#include <nlohmann/json.hpp>

namespace mcp_relay {

struct ChatOptions {
    int max_tool_rounds = 8;
    std::string completions_path = "/v1/chat/completions";
};

// ---------------------------------------------------------------------------
// ChatForwarder — forwards a chat-completions request to an OpenAI-compatible
// inference endpoint and runs the model's tool calls through a session's
// internal MCP client until the model produces a final answer.
//
// Streaming is not relayed: the upstream request is always sent with
// "stream": false and the caller receives one completion object.
// ---------------------------------------------------------------------------
class ChatForwarder {
public:
    // `llm` may be null when no inference endpoint is configured.
    ChatForwarder(std::shared_ptr<IHttpClient> llm, ChatOptions options = {});

    [[nodiscard]] bool IsConfigured() const noexcept { return llm_ != nullptr; }

    // Run one chat turn. The returned JSON is the model's last response.
    Result<nlohmann::json, Error> Forward(nlohmann::json request,
                                          IMcpToolClient& tools) const;

    // Static descriptions of the chat backend served under /chat/.
    static nlohmann::json Props();
    static nlohmann::json Slots();

    [[nodiscard]] const ChatOptions& Options() const noexcept { return options_; }

private:
    Result<nlohmann::json, Error> Complete(const nlohmann::json& request) const;

    // Execute one entry of "tool_calls" and build the matching tool message.
    nlohmann::json RunToolCall(const nlohmann::json& call, IMcpToolClient& tools) const;

    std::shared_ptr<IHttpClient> llm_;
    ChatOptions options_;
};

// Concatenated text of the "text" content items, or the serialized list
// when it holds no text item.
std::string ContentToText(const nlohmann::json& content);

} // namespace mcp_relay

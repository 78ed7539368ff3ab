#pragma once

#include <mcp_relay/core/http_client.hpp>
#include <mcp_relay/core/result.hpp>
#include <mcp_relay/registry/tool_descriptor.hpp>
#include <mcp_relay/registry/tool_registry.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_relay {

// ---------------------------------------------------------------------------
// IMcpToolClient — the tools a chat turn may use and a way to call them.
// ---------------------------------------------------------------------------
class IMcpToolClient {
public:
    virtual ~IMcpToolClient() = default;

    [[nodiscard]] virtual const std::vector<ToolDescriptor>& Tools() const = 0;

    // Registered tools as OpenAI chat-completions "tools" entries.
    [[nodiscard]] virtual nlohmann::json OpenAiTools() const = 0;

    [[nodiscard]] virtual bool HasTool(const std::string& name) const = 0;

    [[nodiscard]] virtual Result<ToolResult, Error> CallTool(
        const std::string& name, const nlohmann::json& arguments) = 0;
};

// ---------------------------------------------------------------------------
// McpHttpClient — JSON-RPC client for the relay's own MCP endpoint, registered
// with one session's tool set. Requests carry the session cookie so they
// resolve back to the same session.
// ---------------------------------------------------------------------------
class McpHttpClient : public IMcpToolClient {
public:
    McpHttpClient(std::shared_ptr<IHttpClient> http,
                  std::string endpoint_path,
                  std::string session_cookie,
                  std::vector<ToolDescriptor> tools);

    [[nodiscard]] const std::vector<ToolDescriptor>& Tools() const override {
        return tools_;
    }
    [[nodiscard]] nlohmann::json OpenAiTools() const override;
    [[nodiscard]] bool HasTool(const std::string& name) const override;

    [[nodiscard]] Result<ToolResult, Error> CallTool(
        const std::string& name, const nlohmann::json& arguments) override;

    // Endpoint URL the tools are registered with.
    [[nodiscard]] std::string EndpointUrl() const;

private:
    Result<nlohmann::json, Error> Rpc(const std::string& method,
                                      const nlohmann::json& params);

    std::shared_ptr<IHttpClient> http_;
    std::string endpoint_path_;
    std::string session_cookie_;
    std::vector<ToolDescriptor> tools_;
    std::atomic<int64_t> next_id_{1};
};

} // namespace mcp_relay

#pragma once

#include <mcp_relay/registry/tool_registry.hpp>

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace mcp_relay {

// ---------------------------------------------------------------------------
// McpServer — MCP 2024-11-05 JSON-RPC 2.0 dispatcher.
//
// Stateless: each request is answered against the tool registry of the
// session it was resolved to. Methods:
//   - initialize
//   - ping
//   - tools/list
//   - tools/call
//   - notifications/* (no response)
// ---------------------------------------------------------------------------
class McpServer {
public:
    McpServer() = default;
    explicit McpServer(std::string server_name) : server_name_(std::move(server_name)) {}

    // Process a single JSON-RPC message and return the response (if any).
    // Returns nullopt for notifications.
    [[nodiscard]] std::optional<nlohmann::json> HandleMessage(
        const nlohmann::json& message, const ToolRegistry& registry) const;

    // Parse a request body and answer it. Returns nullopt when the body is a
    // notification.
    [[nodiscard]] std::optional<std::string> HandleBody(
        const std::string& body, const ToolRegistry& registry) const;

    static nlohmann::json MakeError(const nlohmann::json& id,
                                    int code, const std::string& message);
    static nlohmann::json MakeResult(const nlohmann::json& id,
                                     const nlohmann::json& result);

private:
    nlohmann::json HandleInitialize(const nlohmann::json& params,
                                    const nlohmann::json& id) const;
    nlohmann::json HandleToolsList(const nlohmann::json& id,
                                   const ToolRegistry& registry) const;
    nlohmann::json HandleToolsCall(const nlohmann::json& params,
                                   const nlohmann::json& id,
                                   const ToolRegistry& registry) const;

    std::string server_name_ = "mcp-relay";
};

} // namespace mcp_relay

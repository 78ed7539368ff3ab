#pragma once

#include <mcp_relay/builtin/catalog.hpp>
#include <mcp_relay/core/result.hpp>
#include <mcp_relay/mcp/mcp_http_client.hpp>
#include <mcp_relay/relay/live_connection.hpp>
#include <mcp_relay/relay/relay_engine.hpp>
#include <mcp_relay/session/session_store.hpp>

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_relay {

// Tool-set names that select built-in tools instead of a relay-backed tool.
inline constexpr const char* kInternalToolsName = "internal_tools";
inline constexpr const char* kGlossaryDemoName = "glossary_tool_demo";

// Builds the internal MCP client of a session, registered with `tools`.
using ToolClientFactory = std::function<std::shared_ptr<IMcpToolClient>(
    const std::string& session_id, std::vector<ToolDescriptor> tools)>;

// ---------------------------------------------------------------------------
// SessionLifecycle — processes operator messages arriving on live
// connections: session creation (initUser), tool-set definition (startMcp),
// operator answers (toolResponse) and connection teardown.
// ---------------------------------------------------------------------------
class SessionLifecycle {
public:
    SessionLifecycle(SessionStore& store,
                     std::shared_ptr<const RelayEngine> engine,
                     BuiltinCatalog catalog,
                     ToolClientFactory client_factory);

    // Wrap a freshly accepted connection. The caller owns the channel for
    // the lifetime of the connection.
    std::shared_ptr<ConnectionChannel> OnConnectionOpened(
        std::shared_ptr<ILiveConnection> connection);

    // Handle one text message; malformed messages are logged and dropped.
    void OnMessage(const std::shared_ptr<ConnectionChannel>& channel,
                   const std::string& text);

    Result<void, Error> HandleMessage(const std::shared_ptr<ConnectionChannel>& channel,
                                      const std::string& text);

    // Replace the tool set of `session_id`. `definitions` is one tool
    // definition object or an array of them. Relay-backed tools are bound to
    // `channel`; reserved names install built-in tools instead. The session's
    // internal client is rebuilt to match.
    Result<std::shared_ptr<Session>, Error> DefineTools(
        const std::string& session_id,
        const nlohmann::json& definitions,
        const std::shared_ptr<ConnectionChannel>& channel);

    // Mark the channel closed and wake every relay call waiting on it.
    void OnConnectionClosed(const std::shared_ptr<ConnectionChannel>& channel);

    // Fresh session id "user_<n*7+2>".
    static std::string CreateInitialUser();

private:
    Result<void, Error> HandleInitUser(const std::shared_ptr<ConnectionChannel>& channel,
                                       const std::string& user_name);
    Result<void, Error> HandleStartMcp(const std::shared_ptr<ConnectionChannel>& channel,
                                       const std::string& user_name,
                                       const nlohmann::json& tool);
    Result<void, Error> HandleToolResponse(const std::shared_ptr<ConnectionChannel>& channel,
                                           nlohmann::json answer);

    Result<std::vector<Tool>, Error> BuildTools(
        const nlohmann::json& definitions,
        const std::shared_ptr<ConnectionChannel>& channel) const;

    void Notify(const std::shared_ptr<ConnectionChannel>& channel,
                const nlohmann::json& message) const;

    SessionStore& store_;
    std::shared_ptr<const RelayEngine> engine_;
    BuiltinCatalog catalog_;
    ToolClientFactory client_factory_;
};

} // namespace mcp_relay

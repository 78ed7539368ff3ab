#pragma once

#include <mcp_relay/chat/chat_forwarder.hpp>
#include <mcp_relay/core/result.hpp>
#include <mcp_relay/mcp/mcp_server.hpp>
#include <mcp_relay/session/session_store.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace mcp_relay {

struct GatewayOptions {
    std::string host = "127.0.0.1";
    uint16_t port = 0;
    std::optional<std::string> public_path;
    std::string cookie_name = "MCP_RELAY_USER_ID";
};

struct GatewayResponse {
    int status = 200;
    std::string body;
    std::string content_type = "application/json";
};

// ---------------------------------------------------------------------------
// HttpGateway — the HTTP surface of the relay:
//   POST /mcp/                     MCP JSON-RPC of the cookie's session
//   GET  /chat/props, /chat/slots  static chat backend description
//   POST /chat/v1/chat/completions chat turn with the session's tools
//   GET  /stop.do                  shutdown
//   GET  /, /<name>.<ext>          static files below public_path
//
// The Handle* methods are transport-free; Start() binds them to a
// cpp-httplib server.
// ---------------------------------------------------------------------------
class HttpGateway {
public:
    HttpGateway(SessionStore& store, std::shared_ptr<const ChatForwarder> chat,
                GatewayOptions options);
    ~HttpGateway();

    HttpGateway(const HttpGateway&) = delete;
    HttpGateway& operator=(const HttpGateway&) = delete;

    [[nodiscard]] GatewayResponse HandleMcp(const std::optional<std::string>& cookie,
                                            const std::string& body) const;
    [[nodiscard]] GatewayResponse HandleChat(const std::optional<std::string>& cookie,
                                             const std::string& body) const;
    [[nodiscard]] GatewayResponse HandleStatic(const std::string& path) const;
    [[nodiscard]] static GatewayResponse HandleProps();
    [[nodiscard]] static GatewayResponse HandleSlots();

    // Invoked once after /stop.do has been answered.
    void SetShutdownHandler(std::function<void()> handler);

    // Bind the listener. Port 0 picks a free port, see Port().
    Result<void, Error> Bind();

    // Serve until Stop(). Requires Bind().
    Result<void, Error> Run();

    void Stop();

    [[nodiscard]] uint16_t Port() const noexcept { return bound_port_; }
    [[nodiscard]] const GatewayOptions& Options() const noexcept { return options_; }

private:
    // Session id of the request or the 400 response to send.
    Result<std::string, GatewayResponse> SessionIdFrom(
        const std::optional<std::string>& cookie) const;

    void RegisterRoutes();

    SessionStore& store_;
    std::shared_ptr<const ChatForwarder> chat_;
    GatewayOptions options_;
    McpServer mcp_;

    struct Impl;
    std::unique_ptr<Impl> impl_;
    uint16_t bound_port_ = 0;
};

} // namespace mcp_relay

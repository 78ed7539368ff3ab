#pragma once

#include <mcp_relay/builtin/catalog.hpp>
#include <mcp_relay/chat/chat_forwarder.hpp>
#include <mcp_relay/config/app_config.hpp>
#include <mcp_relay/core/result.hpp>
#include <mcp_relay/relay/relay_engine.hpp>
#include <mcp_relay/server/http_gateway.hpp>
#include <mcp_relay/server/websocket_server.hpp>
#include <mcp_relay/session/session_lifecycle.hpp>
#include <mcp_relay/session/session_store.hpp>

#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace mcp_relay {

// Options for RelayOptions from the relay section of the config.
RelayOptions RelayOptionsFrom(const RelayConfig& config);

// ---------------------------------------------------------------------------
// RelayApp — the running relay: session store, lifecycle, WebSocket server
// for operator UIs and the HTTP gateway, wired from one AppConfig.
// ---------------------------------------------------------------------------
class RelayApp {
    struct CreateKey {
        explicit CreateKey() = default;
    };

public:
    static Result<std::unique_ptr<RelayApp>, Error> Create(const AppConfig& config);

    // Only reachable through Create().
    RelayApp(CreateKey, AppConfig config, BuiltinCatalog catalog);
    ~RelayApp();

    RelayApp(const RelayApp&) = delete;
    RelayApp& operator=(const RelayApp&) = delete;

    // Bind both listeners and start the background threads.
    Result<void, Error> Start();

    // Serve HTTP until Stop() or /stop.do; stops everything on return.
    Result<void, Error> Run();

    void Stop();

    [[nodiscard]] uint16_t HttpPort() const { return gateway_->Port(); }
    [[nodiscard]] uint16_t WsPort() const { return ws_->Port(); }

    [[nodiscard]] SessionStore& Sessions() noexcept { return store_; }
    [[nodiscard]] SessionLifecycle& Lifecycle() noexcept { return *lifecycle_; }

private:
    std::shared_ptr<IMcpToolClient> MakeToolClient(const std::string& session_id,
                                                   std::vector<ToolDescriptor> tools) const;
    void EvictionLoop();

    AppConfig config_;
    SessionStore store_;
    std::unique_ptr<SessionLifecycle> lifecycle_;
    std::unique_ptr<HttpGateway> gateway_;
    std::unique_ptr<WebSocketServer> ws_;

    std::mutex stop_mutex_;
    std::condition_variable stop_cv_;
    bool stopping_ = false;
    std::thread eviction_thread_;
};

} // namespace mcp_relay

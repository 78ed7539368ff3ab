#pragma once

#include <mcp_relay/core/result.hpp>
#include <mcp_relay/mcp/mcp_http_client.hpp>
#include <mcp_relay/registry/tool_registry.hpp>
#include <mcp_relay/relay/live_connection.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace mcp_relay {

// ---------------------------------------------------------------------------
// Session — per-user aggregate: tool registry, live connection and the
// internal MCP client registered with the same tools.
//
// The live connection is held weakly; it may close or go away while the
// session lives on. InstallToolSet() replaces the tools and the client
// together so both always describe the same tool set.
// ---------------------------------------------------------------------------
class Session {
public:
    using Clock = std::chrono::steady_clock;

    explicit Session(std::string id);

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    [[nodiscard]] const std::string& Id() const noexcept { return id_; }

    void InstallToolSet(std::vector<Tool> tools,
                        std::weak_ptr<ConnectionChannel> channel,
                        std::shared_ptr<IMcpToolClient> client);

    // True once a tool set has been installed.
    [[nodiscard]] bool HasToolSet() const;

    [[nodiscard]] const ToolRegistry& Tools() const noexcept { return registry_; }

    // Null when no tool set is installed or the connection is gone.
    [[nodiscard]] std::shared_ptr<ConnectionChannel> Channel() const;
    [[nodiscard]] std::shared_ptr<IMcpToolClient> Client() const;

    void Touch();
    [[nodiscard]] Clock::time_point LastAccess() const;

private:
    const std::string id_;
    ToolRegistry registry_;

    mutable std::mutex mutex_;
    std::weak_ptr<ConnectionChannel> channel_;
    std::shared_ptr<IMcpToolClient> client_;
    bool has_tool_set_ = false;
    Clock::time_point last_access_;
};

// ---------------------------------------------------------------------------
// SessionStore — session id to Session.
//
// Sessions are never removed implicitly; EvictIdle() is the only way out
// and is run by the server only when an idle timeout is configured.
// ---------------------------------------------------------------------------
class SessionStore {
public:
    // Get-or-create. Calling twice with the same id returns the same Session.
    std::shared_ptr<Session> Resolve(const std::string& session_id);

    // Existing session with an installed tool set, else UnknownSession.
    [[nodiscard]] Result<std::shared_ptr<Session>, Error> Find(
        const std::string& session_id) const;

    // Existing session or nullptr; never creates.
    [[nodiscard]] std::shared_ptr<Session> Lookup(const std::string& session_id) const;

    [[nodiscard]] size_t Size() const;

    // Remove sessions not accessed for `max_idle` whose live connection is
    // closed or gone. Returns the number removed.
    size_t EvictIdle(std::chrono::milliseconds max_idle);

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Session>> sessions_;
};

} // namespace mcp_relay

#pragma once

#include <mcp_relay/core/result.hpp>
#include <mcp_relay/session/session_lifecycle.hpp>

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace mcp_relay {

struct WebSocketOptions {
    std::string host = "127.0.0.1";
    uint16_t port = 0;  // 0 picks a free port
    std::string path = "/ws";
    size_t max_clients = 64;
};

// ---------------------------------------------------------------------------
// WebSocketServer — accepts operator UI connections and feeds them to the
// session lifecycle. One reader thread per client; writes from relay calls
// are serialized per client.
// ---------------------------------------------------------------------------
class WebSocketServer {
public:
    explicit WebSocketServer(SessionLifecycle& lifecycle);
    ~WebSocketServer();

    WebSocketServer(const WebSocketServer&) = delete;
    WebSocketServer& operator=(const WebSocketServer&) = delete;

    Result<void, Error> Start(const WebSocketOptions& options);

    // Close the listener and every client, then wait for the client threads.
    void Stop();

    [[nodiscard]] bool IsRunning() const { return running_.load(); }
    [[nodiscard]] uint16_t Port() const { return bound_port_; }
    [[nodiscard]] size_t ClientCount() const;

    struct Client;

private:
    void AcceptLoop(int listen_fd);
    void ClientLoop(std::shared_ptr<Client> client);
    bool PerformHandshake(Client& client);
    void RemoveClient(const std::shared_ptr<Client>& client);

    SessionLifecycle& lifecycle_;
    WebSocketOptions options_;

    std::atomic<bool> running_{false};
    int listen_fd_ = -1;  // owned by Start()/Stop(); the accept thread gets a copy
    uint16_t bound_port_ = 0;
    std::thread accept_thread_;

    mutable std::mutex clients_mutex_;
    std::condition_variable clients_done_;
    std::map<int, std::shared_ptr<Client>> clients_;
    size_t active_threads_ = 0;
    std::atomic<uint64_t> next_client_id_{1};
};

} // namespace mcp_relay

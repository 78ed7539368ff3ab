#include <mcp_relay/server/websocket_server.hpp>

#include <mcp_relay/core/log.hpp>
#include <mcp_relay/server/websocket_frame.hpp>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>

namespace mcp_relay {

struct WebSocketServer::Client {
    int fd = -1;
    std::string id;
    std::mutex write_mutex;
    std::atomic<bool> closed{false};
};

namespace {

constexpr int kListenBacklog = 64;
constexpr uint16_t kCloseProtocolError = 1002;

bool SendAll(int fd, const char* data, size_t size) {
    size_t sent = 0;
    while (sent < size) {
        const ssize_t n = ::send(fd, data + sent, size - sent, MSG_NOSIGNAL);
        if (n <= 0) {
            if (n < 0 && errno == EINTR) continue;
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

bool RecvExact(int fd, uint8_t* data, size_t size) {
    size_t received = 0;
    while (received < size) {
        const ssize_t n = ::recv(fd, data + received, size - received, 0);
        if (n <= 0) {
            if (n < 0 && errno == EINTR) continue;
            return false;
        }
        received += static_cast<size_t>(n);
    }
    return true;
}

std::string NormalizeBindHost(const std::string& host) {
    if (host == "localhost" || host.empty()) {
        return "127.0.0.1";
    }
    return host;
}

std::string ClosePayload(uint16_t code) {
    std::string payload;
    payload.push_back(static_cast<char>((code >> 8u) & 0xFFu));
    payload.push_back(static_cast<char>(code & 0xFFu));
    return payload;
}

// Writes under the client's write mutex; fails once the socket is gone.
Result<void, Error> WriteFrame(WebSocketServer::Client& client, WsOpcode opcode,
                               const std::string& payload) {
    std::lock_guard<std::mutex> lock(client.write_mutex);
    if (client.closed.load() || client.fd < 0) {
        return Result<void, Error>::Err(Error::Make(
            ErrorCategory::DeliveryFailed, "WsSend", "Connection " + client.id + " is closed"));
    }
    const auto frame = EncodeFrame(opcode, payload);
    if (!SendAll(client.fd, frame.data(), frame.size())) {
        return Result<void, Error>::Err(Error::Make(
            ErrorCategory::DeliveryFailed, "WsSend",
            "Write to " + client.id + " failed: " + std::strerror(errno)));
    }
    return Result<void, Error>::Ok();
}

// ILiveConnection over one accepted WebSocket client.
class WebSocketConnection : public ILiveConnection {
public:
    explicit WebSocketConnection(std::shared_ptr<WebSocketServer::Client> client)
        : client_(std::move(client)) {}

    Result<void, Error> Send(const std::string& text) override {
        return WriteFrame(*client_, WsOpcode::Text, text);
    }
    [[nodiscard]] bool IsClosed() const override { return client_->closed.load(); }
    [[nodiscard]] std::string Id() const override { return client_->id; }

private:
    std::shared_ptr<WebSocketServer::Client> client_;
};

} // anonymous namespace

WebSocketServer::WebSocketServer(SessionLifecycle& lifecycle) : lifecycle_(lifecycle) {}

WebSocketServer::~WebSocketServer() { Stop(); }

size_t WebSocketServer::ClientCount() const {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    return clients_.size();
}

Result<void, Error> WebSocketServer::Start(const WebSocketOptions& options) {
    using R = Result<void, Error>;
    auto fail = [](const std::string& message) {
        return R::Err(Error::Make(ErrorCategory::Io, "WebSocketStart", message));
    };

    if (running_) {
        return fail("WebSocket server already running");
    }

    listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (listen_fd_ < 0) {
        return fail(std::string("socket() failed: ") + std::strerror(errno));
    }
    int reuse = 1;
    if (::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) != 0) {
        LogWarn("ws", std::string("SO_REUSEADDR not set: ") + std::strerror(errno));
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(options.port);
    const auto bind_host = NormalizeBindHost(options.host);
    if (::inet_pton(AF_INET, bind_host.c_str(), &addr.sin_addr) != 1) {
        ::close(listen_fd_);
        listen_fd_ = -1;
        return fail("Invalid WebSocket bind host: " + options.host);
    }
    if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
        ::listen(listen_fd_, kListenBacklog) != 0) {
        const std::string message = std::strerror(errno);
        ::close(listen_fd_);
        listen_fd_ = -1;
        return fail("Cannot listen on " + bind_host + ":" + std::to_string(options.port) +
                    ": " + message);
    }

    sockaddr_in actual{};
    socklen_t actual_len = sizeof(actual);
    if (::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&actual), &actual_len) == 0) {
        bound_port_ = ntohs(actual.sin_port);
    } else {
        bound_port_ = options.port;
    }

    options_ = options;
    running_ = true;
    accept_thread_ = std::thread([this, fd = listen_fd_]() { AcceptLoop(fd); });
    LogInfo("ws", "Listening on ws://" + bind_host + ":" + std::to_string(bound_port_) +
            options_.path);
    return R::Ok();
}

void WebSocketServer::Stop() {
    const bool was_running = running_.exchange(false);
    // Shutdown wakes accept(); the descriptor is closed only after the
    // accept thread is gone so its number cannot be reused under it.
    if (listen_fd_ >= 0) {
        ::shutdown(listen_fd_, SHUT_RDWR);
    }
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }
    if (listen_fd_ >= 0) {
        ::close(listen_fd_);
        listen_fd_ = -1;
    }

    std::unique_lock<std::mutex> lock(clients_mutex_);
    for (auto& entry : clients_) {
        // Unblocks the reader thread; it closes the descriptor itself.
        ::shutdown(entry.first, SHUT_RDWR);
    }
    clients_done_.wait(lock, [this]() { return active_threads_ == 0; });
    bound_port_ = 0;
    if (was_running) {
        LogInfo("ws", "WebSocket server stopped");
    }
}

void WebSocketServer::AcceptLoop(int listen_fd) {
    while (running_) {
        sockaddr_in client_addr{};
        socklen_t len = sizeof(client_addr);
        const int fd = ::accept(listen_fd, reinterpret_cast<sockaddr*>(&client_addr), &len);
        if (fd < 0) {
            if (!running_) break;
            continue;
        }

        auto client = std::make_shared<Client>();
        client->fd = fd;
        client->id = "ws-" + std::to_string(next_client_id_++);

        {
            std::lock_guard<std::mutex> lock(clients_mutex_);
            if (clients_.size() >= options_.max_clients) {
                const auto response = BuildHttpError(503, "Service Unavailable",
                                                     "Too many WebSocket clients");
                SendAll(fd, response.data(), response.size());
                ::shutdown(fd, SHUT_RDWR);
                ::close(fd);
                LogWarn("ws", "Refused connection: client limit reached");
                continue;
            }
            clients_[fd] = client;
            ++active_threads_;
        }
        std::thread([this, client]() { ClientLoop(client); }).detach();
    }
}

bool WebSocketServer::PerformHandshake(Client& client) {
    std::string request;
    std::array<char, 1024> buf{};
    while (request.size() < kMaxWsHandshakeBytes &&
           request.find("\r\n\r\n") == std::string::npos) {
        const ssize_t n = ::recv(client.fd, buf.data(), buf.size(), 0);
        if (n <= 0) {
            return false;
        }
        request.append(buf.data(), static_cast<size_t>(n));
    }

    auto parsed = ParseHandshakeRequest(request);
    if (parsed.IsErr()) {
        LogWarn("ws", "Rejected handshake on " + client.id + ": " + parsed.Error().message);
        const auto response = BuildHttpError(400, "Bad Request", parsed.Error().message);
        SendAll(client.fd, response.data(), response.size());
        return false;
    }
    const auto& handshake = parsed.Value();
    if (handshake.path != options_.path) {
        LogWarn("ws", "Rejected handshake on " + client.id + ": unknown path " + handshake.path);
        const auto response = BuildHttpError(404, "Not Found", "File not found");
        SendAll(client.fd, response.data(), response.size());
        return false;
    }

    const auto response = BuildHandshakeResponse(handshake.Header("sec-websocket-key"));
    return SendAll(client.fd, response.data(), response.size());
}

void WebSocketServer::ClientLoop(std::shared_ptr<Client> client) {
    if (!PerformHandshake(*client)) {
        RemoveClient(client);
        return;
    }

    auto channel = lifecycle_.OnConnectionOpened(std::make_shared<WebSocketConnection>(client));
    const int fd = client->fd;
    const ByteReader reader = [fd](uint8_t* data, size_t size) {
        return RecvExact(fd, data, size);
    };

    while (running_) {
        auto frame = ReadFrame(reader);
        if (frame.IsErr()) {
            const auto& error = frame.Error();
            if (error.category == ErrorCategory::MalformedMessage) {
                LogWarn("ws", "Protocol error on " + client->id + ": " + error.message);
                (void)WriteFrame(*client, WsOpcode::Close, ClosePayload(kCloseProtocolError));
            }
            break;
        }

        auto& value = frame.Value();
        if (value.opcode == WsOpcode::Close) {
            (void)WriteFrame(*client, WsOpcode::Close, value.payload.substr(0, 2));
            break;
        }
        if (value.opcode == WsOpcode::Ping) {
            auto pong = WriteFrame(*client, WsOpcode::Pong, value.payload);
            if (pong.IsErr()) break;
            continue;
        }
        if (value.opcode != WsOpcode::Text) {
            LogDebug("ws", "Ignoring non-text frame on " + client->id);
            continue;
        }
        lifecycle_.OnMessage(channel, value.payload);
    }

    client->closed = true;
    lifecycle_.OnConnectionClosed(channel);
    RemoveClient(client);
}

void WebSocketServer::RemoveClient(const std::shared_ptr<Client>& client) {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    {
        std::lock_guard<std::mutex> write_lock(client->write_mutex);
        client->closed = true;
        if (client->fd >= 0) {
            clients_.erase(client->fd);
            ::shutdown(client->fd, SHUT_RDWR);
            ::close(client->fd);
            client->fd = -1;
        }
    }
    --active_threads_;
    clients_done_.notify_all();
}

} // namespace mcp_relay

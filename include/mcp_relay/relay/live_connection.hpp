#pragma once

#include <mcp_relay/core/result.hpp>
#include <mcp_relay/relay/correlation_queue.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

namespace mcp_relay {

// ---------------------------------------------------------------------------
// ILiveConnection — the operator's persistent UI channel (a WebSocket in
// production, a recording double in tests). Send() may be called from any
// thread.
// ---------------------------------------------------------------------------
class ILiveConnection {
public:
    virtual ~ILiveConnection() = default;

    virtual Result<void, Error> Send(const std::string& text) = 0;
    [[nodiscard]] virtual bool IsClosed() const = 0;
    [[nodiscard]] virtual std::string Id() const = 0;
};

// ---------------------------------------------------------------------------
// ConnectionChannel — a live connection plus the correlation queue its
// operator answers land in. One channel exists per accepted connection;
// sessions only hold weak references to it.
// ---------------------------------------------------------------------------
class ConnectionChannel {
public:
    explicit ConnectionChannel(std::shared_ptr<ILiveConnection> connection);

    // Serialize and push one message. Fails with DeliveryFailed when the
    // channel is closed or the transport reports an error.
    Result<void, Error> Send(const nlohmann::json& message);

    // Mark closed and wake every relay call waiting on this channel.
    void MarkClosed();

    [[nodiscard]] bool IsClosed() const;
    [[nodiscard]] std::string Id() const { return connection_->Id(); }

    CorrelationQueue& Answers() noexcept { return answers_; }

    // Time of the last successful Send() or received message. Used for
    // idle eviction.
    void Touch();
    [[nodiscard]] std::chrono::steady_clock::time_point LastActivity() const;

private:
    std::shared_ptr<ILiveConnection> connection_;
    CorrelationQueue answers_;
    std::atomic<bool> closed_{false};
    std::atomic<std::chrono::steady_clock::rep> last_activity_;
};

} // namespace mcp_relay

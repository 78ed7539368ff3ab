#include <mcp_relay/relay/live_connection.hpp>

#include <mcp_relay/core/log.hpp>

namespace mcp_relay {

ConnectionChannel::ConnectionChannel(std::shared_ptr<ILiveConnection> connection)
    : connection_(std::move(connection)),
      last_activity_(std::chrono::steady_clock::now().time_since_epoch().count()) {}

Result<void, Error> ConnectionChannel::Send(const nlohmann::json& message) {
    if (IsClosed()) {
        return Result<void, Error>::Err(Error::Make(
            ErrorCategory::DeliveryFailed, "LiveSend",
            "Connection " + connection_->Id() + " is closed"));
    }

    std::string text;
    try {
        text = message.dump();
    } catch (const nlohmann::json::exception& e) {
        return Result<void, Error>::Err(Error::Make(
            ErrorCategory::DeliveryFailed, "LiveSend",
            std::string("Message not serializable: ") + e.what()));
    }

    auto sent = connection_->Send(text);
    if (sent.IsErr()) {
        auto error = sent.Error();
        error.category = ErrorCategory::DeliveryFailed;
        return Result<void, Error>::Err(std::move(error));
    }
    Touch();
    return Result<void, Error>::Ok();
}

void ConnectionChannel::MarkClosed() {
    if (!closed_.exchange(true)) {
        LogDebug("relay", "Channel " + connection_->Id() + " marked closed");
    }
    answers_.Wake();
}

bool ConnectionChannel::IsClosed() const {
    return closed_.load() || connection_->IsClosed();
}

void ConnectionChannel::Touch() {
    last_activity_.store(std::chrono::steady_clock::now().time_since_epoch().count());
}

std::chrono::steady_clock::time_point ConnectionChannel::LastActivity() const {
    return std::chrono::steady_clock::time_point(
        std::chrono::steady_clock::duration(last_activity_.load()));
}

} // namespace mcp_relay

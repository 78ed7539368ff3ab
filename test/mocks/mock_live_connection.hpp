#pragma once

#include <mcp_relay/relay/live_connection.hpp>

#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_relay {
namespace testing {

// ---------------------------------------------------------------------------
// MockLiveConnection — records every message sent to the operator.
//
// Thread-safe: relay calls send from worker threads. An optional send hook
// runs after each recorded send (outside the lock) and can play the operator,
// e.g. by offering an answer to the channel.
// ---------------------------------------------------------------------------
class MockLiveConnection : public ILiveConnection {
public:
    using SendHook = std::function<void(const nlohmann::json& message)>;

    explicit MockLiveConnection(std::string id = "mock-1") : id_(std::move(id)) {}

    Result<void, Error> Send(const std::string& text) override {
        SendHook hook;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (fail_sends_) {
                return Result<void, Error>::Err(Error::Make(
                    ErrorCategory::DeliveryFailed, "MockSend", "send refused"));
            }
            sent_.push_back(text);
            hook = hook_;
        }
        if (hook) {
            hook(nlohmann::json::parse(text));
        }
        return Result<void, Error>::Ok();
    }

    [[nodiscard]] bool IsClosed() const override { return closed_.load(); }
    [[nodiscard]] std::string Id() const override { return id_; }

    void Close() { closed_ = true; }

    void SetFailSends(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_sends_ = fail;
    }

    void SetSendHook(SendHook hook) {
        std::lock_guard<std::mutex> lock(mutex_);
        hook_ = std::move(hook);
    }

    [[nodiscard]] std::vector<std::string> Sent() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_;
    }

    [[nodiscard]] std::vector<nlohmann::json> SentJson() const {
        std::vector<nlohmann::json> out;
        for (const auto& text : Sent()) {
            out.push_back(nlohmann::json::parse(text));
        }
        return out;
    }

    // Sent messages whose "action" equals `action`.
    [[nodiscard]] std::vector<nlohmann::json> SentWithAction(const std::string& action) const {
        std::vector<nlohmann::json> out;
        for (auto& message : SentJson()) {
            if (message.value("action", "") == action) {
                out.push_back(std::move(message));
            }
        }
        return out;
    }

    [[nodiscard]] size_t SentCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_.size();
    }

private:
    std::string id_;
    mutable std::mutex mutex_;
    std::vector<std::string> sent_;
    bool fail_sends_ = false;
    SendHook hook_;
    std::atomic<bool> closed_{false};
};

} // namespace testing
} // namespace mcp_relay

#pragma once

#include <mcp_relay/relay/live_connection.hpp>

#include <chrono>
#include <string>

#include <nlohmann/json.hpp>

namespace mcp_relay {

// ---------------------------------------------------------------------------
// RelayState — lifecycle of one relay call.
//
//   Created -> Dispatched -> Answered | TimedOut | ConnectionClosed
//   Created -> DeliveryFailed
// ---------------------------------------------------------------------------
enum class RelayState {
    Created,
    Dispatched,
    Answered,
    TimedOut,
    ConnectionClosed,
    DeliveryFailed,
};

const char* RelayStateName(RelayState state);

struct RelayOptions {
    std::chrono::milliseconds deadline = std::chrono::seconds(60);
    std::chrono::milliseconds poll_interval = std::chrono::seconds(1);
    // Discard answers left over from earlier calls before dispatching.
    bool drain_stale_answers = true;
};

struct RelayOutcome {
    RelayState state = RelayState::Created;
    nlohmann::json content = nlohmann::json::array();
    std::chrono::milliseconds elapsed{0};

    [[nodiscard]] bool Answered() const noexcept {
        return state == RelayState::Answered;
    }
};

// ---------------------------------------------------------------------------
// RelayEngine — turns a synchronous tool invocation into a round trip with
// the operator: push a toolCall notification, then block until an answer,
// a closed connection or the deadline.
//
// Only Answered produces content (a one-element list holding the answer).
// Every other terminal state yields an empty list and is reported through
// the log only.
// ---------------------------------------------------------------------------
class RelayEngine {
public:
    RelayEngine() = default;
    explicit RelayEngine(RelayOptions options) : options_(options) {}

    [[nodiscard]] RelayOutcome Call(ConnectionChannel& channel,
                                    const std::string& tool_name,
                                    const nlohmann::json& params) const;

    [[nodiscard]] const RelayOptions& Options() const noexcept { return options_; }

private:
    RelayOptions options_;
};

} // namespace mcp_relay

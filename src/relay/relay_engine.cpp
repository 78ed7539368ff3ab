#include <mcp_relay/relay/relay_engine.hpp>

#include <mcp_relay/core/log.hpp>
#include <mcp_relay/relay/live_protocol.hpp>

namespace mcp_relay {

const char* RelayStateName(RelayState state) {
    switch (state) {
        case RelayState::Created:          return "Created";
        case RelayState::Dispatched:       return "Dispatched";
        case RelayState::Answered:         return "Answered";
        case RelayState::TimedOut:         return "TimedOut";
        case RelayState::ConnectionClosed: return "ConnectionClosed";
        case RelayState::DeliveryFailed:   return "DeliveryFailed";
    }
    return "Unknown";
}

namespace {

std::chrono::milliseconds Since(CorrelationQueue::Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        CorrelationQueue::Clock::now() - start);
}

} // anonymous namespace

RelayOutcome RelayEngine::Call(ConnectionChannel& channel,
                               const std::string& tool_name,
                               const nlohmann::json& params) const {
    const auto start = CorrelationQueue::Clock::now();
    const std::string where = "'" + tool_name + "' on " + channel.Id();
    RelayOutcome outcome;

    if (options_.drain_stale_answers) {
        const auto dropped = channel.Answers().Drain();
        if (dropped > 0) {
            LogWarn("relay", "stale answer discarded (" + std::to_string(dropped) +
                    ") before dispatching " + where);
        }
    }

    auto sent = channel.Send(live::ToolCall(params));
    if (sent.IsErr()) {
        LogError("relay", "Delivery of " + where + " failed: " + sent.Error().message);
        outcome.state = RelayState::DeliveryFailed;
        outcome.elapsed = Since(start);
        return outcome;
    }
    outcome.state = RelayState::Dispatched;
    LogInfo("relay", "Dispatched " + where);

    const auto deadline = start + options_.deadline;
    auto answer = channel.Answers().Await(
        deadline, [&channel] { return channel.IsClosed(); }, options_.poll_interval);
    outcome.elapsed = Since(start);

    if (answer.has_value()) {
        outcome.state = RelayState::Answered;
        outcome.content = nlohmann::json::array({std::move(*answer)});
        LogInfo("relay", "Answered " + where + " after " +
                std::to_string(outcome.elapsed.count()) + " ms");
    } else if (channel.IsClosed()) {
        outcome.state = RelayState::ConnectionClosed;
        LogWarn("relay", "Connection closed while waiting for " + where);
    } else {
        outcome.state = RelayState::TimedOut;
        LogInfo("relay", "No answer for " + where + ", timeout after " +
                std::to_string(outcome.elapsed.count()) + " ms");
    }
    return outcome;
}

} // namespace mcp_relay

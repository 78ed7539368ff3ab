#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>

#include <nlohmann/json.hpp>

namespace mcp_relay {

// ---------------------------------------------------------------------------
// CorrelationQueue — hands operator answers from the connection's message
// thread to a tool invocation blocked in Await().
//
// Offer() never blocks. An answer offered while nobody waits stays queued
// and satisfies the next Await() unless Drain() is called first. Answers
// carry no call id: concurrent waiters compete and the first one to wake
// takes the oldest answer.
// ---------------------------------------------------------------------------
class CorrelationQueue {
public:
    using Clock = std::chrono::steady_clock;

    void Offer(nlohmann::json value);

    // Block until an answer is available, `is_cancelled` returns true or
    // `deadline` passes. Cancellation is re-checked at least every
    // `poll_interval` and immediately after Wake(). Returns std::nullopt on
    // timeout or cancellation; never returns before the deadline unless an
    // answer or a cancellation was observed.
    [[nodiscard]] std::optional<nlohmann::json> Await(
        Clock::time_point deadline,
        const std::function<bool()>& is_cancelled,
        std::chrono::milliseconds poll_interval = std::chrono::seconds(1));

    // Discard queued answers. Returns how many were dropped.
    size_t Drain();

    // Wake all waiters so they re-check cancellation now.
    void Wake();

    [[nodiscard]] size_t Size() const;
    [[nodiscard]] size_t Waiters() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<nlohmann::json> answers_;
    uint64_t wake_generation_ = 0;
    size_t waiters_ = 0;
};

} // namespace mcp_relay

#include <mcp_relay/relay/correlation_queue.hpp>

#include <algorithm>

namespace mcp_relay {

void CorrelationQueue::Offer(nlohmann::json value) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        answers_.push_back(std::move(value));
    }
    cv_.notify_all();
}

std::optional<nlohmann::json> CorrelationQueue::Await(
    Clock::time_point deadline,
    const std::function<bool()>& is_cancelled,
    std::chrono::milliseconds poll_interval) {
    if (poll_interval <= std::chrono::milliseconds::zero()) {
        poll_interval = std::chrono::milliseconds(1);
    }

    std::unique_lock<std::mutex> lock(mutex_);
    ++waiters_;
    std::optional<nlohmann::json> result;

    while (true) {
        if (!answers_.empty()) {
            result = std::move(answers_.front());
            answers_.pop_front();
            break;
        }

        // The cancellation predicate may take other locks; evaluate it
        // without holding ours. The generation taken before the check lets
        // a Wake() issued in between end the next wait early.
        const auto seen_generation = wake_generation_;
        lock.unlock();
        const bool cancelled = is_cancelled && is_cancelled();
        lock.lock();
        if (cancelled) {
            break;
        }
        if (!answers_.empty()) {
            continue;
        }

        const auto now = Clock::now();
        if (now >= deadline) {
            break;
        }
        const auto wake_at = std::min(deadline, now + poll_interval);
        cv_.wait_until(lock, wake_at, [&] {
            return !answers_.empty() || wake_generation_ != seen_generation;
        });
    }

    --waiters_;
    return result;
}

size_t CorrelationQueue::Drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto dropped = answers_.size();
    answers_.clear();
    return dropped;
}

void CorrelationQueue::Wake() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++wake_generation_;
    }
    cv_.notify_all();
}

size_t CorrelationQueue::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return answers_.size();
}

size_t CorrelationQueue::Waiters() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return waiters_;
}

} // namespace mcp_relay

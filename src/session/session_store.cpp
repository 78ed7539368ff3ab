#include <mcp_relay/session/session_store.hpp>

#include <mcp_relay/core/log.hpp>

namespace mcp_relay {

// ---------------------------------------------------------------------------
// Session
// ---------------------------------------------------------------------------
Session::Session(std::string id)
    : id_(std::move(id)), last_access_(Clock::now()) {}

void Session::InstallToolSet(std::vector<Tool> tools,
                             std::weak_ptr<ConnectionChannel> channel,
                             std::shared_ptr<IMcpToolClient> client) {
    std::lock_guard<std::mutex> lock(mutex_);
    registry_.ReplaceAll(std::move(tools));
    channel_ = std::move(channel);
    client_ = std::move(client);
    has_tool_set_ = true;
    last_access_ = Clock::now();
}

bool Session::HasToolSet() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return has_tool_set_;
}

std::shared_ptr<ConnectionChannel> Session::Channel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return channel_.lock();
}

std::shared_ptr<IMcpToolClient> Session::Client() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return client_;
}

void Session::Touch() {
    std::lock_guard<std::mutex> lock(mutex_);
    last_access_ = Clock::now();
}

Session::Clock::time_point Session::LastAccess() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_access_;
}

// ---------------------------------------------------------------------------
// SessionStore
// ---------------------------------------------------------------------------
std::shared_ptr<Session> SessionStore::Resolve(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it != sessions_.end()) {
        return it->second;
    }
    auto session = std::make_shared<Session>(session_id);
    sessions_.emplace(session_id, session);
    LogInfo("session", "Created session " + session_id);
    return session;
}

Result<std::shared_ptr<Session>, Error> SessionStore::Find(
    const std::string& session_id) const {
    using R = Result<std::shared_ptr<Session>, Error>;

    auto session = Lookup(session_id);
    if (!session || !session->HasToolSet()) {
        LogWarn("session", "Unknown session: " + session_id);
        auto error = Error::Make(ErrorCategory::UnknownSession, "FindSession",
                                 "unknown user-id");
        error.detail = session_id;
        return R::Err(std::move(error));
    }
    session->Touch();
    return R::Ok(std::move(session));
}

std::shared_ptr<Session> SessionStore::Lookup(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    return it == sessions_.end() ? nullptr : it->second;
}

size_t SessionStore::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

size_t SessionStore::EvictIdle(std::chrono::milliseconds max_idle) {
    const auto now = Session::Clock::now();
    std::vector<std::string> evicted;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = sessions_.begin(); it != sessions_.end();) {
            const auto& session = it->second;
            auto channel = session->Channel();
            const bool connected = channel && !channel->IsClosed();
            if (!connected && now - session->LastAccess() >= max_idle) {
                evicted.push_back(it->first);
                it = sessions_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (const auto& id : evicted) {
        LogInfo("session", "Evicted idle session " + id);
    }
    return evicted.size();
}

} // namespace mcp_relay

#include <mcp_relay/server/relay_app.hpp>

#include <mcp_relay/builtin/catalog.hpp>
#include <mcp_relay/core/http_client.hpp>
#include <mcp_relay/core/log.hpp>
#include <mcp_relay/core/url.hpp>
#include <mcp_relay/server/cookies.hpp>

#include <algorithm>

namespace mcp_relay {

namespace {

constexpr const char* kMcpPath = "/mcp/";

// The internal client talks to this process; a wildcard bind address is
// reached through loopback.
std::string LoopbackHost(const std::string& host) {
    if (host == "0.0.0.0" || host.empty()) {
        return "127.0.0.1";
    }
    return host;
}

} // anonymous namespace

RelayOptions RelayOptionsFrom(const RelayConfig& config) {
    RelayOptions options;
    options.deadline = std::chrono::seconds(config.deadline_seconds);
    options.poll_interval = std::chrono::milliseconds(config.poll_interval_ms);
    return options;
}

Result<std::unique_ptr<RelayApp>, Error> RelayApp::Create(const AppConfig& config) {
    using R = Result<std::unique_ptr<RelayApp>, Error>;

    auto catalog = BuildBuiltinCatalog(config.tools);
    if (catalog.IsErr()) {
        return R::Err(catalog.Error());
    }
    return R::Ok(std::make_unique<RelayApp>(CreateKey{}, config, std::move(catalog).Value()));
}

RelayApp::RelayApp(CreateKey, AppConfig config, BuiltinCatalog catalog)
    : config_(std::move(config)) {
    auto engine = std::make_shared<const RelayEngine>(RelayOptionsFrom(config_.relay));
    lifecycle_ = std::make_unique<SessionLifecycle>(
        store_, std::move(engine), std::move(catalog),
        [this](const std::string& session_id, std::vector<ToolDescriptor> tools) {
            return MakeToolClient(session_id, std::move(tools));
        });

    std::shared_ptr<IHttpClient> llm;
    ChatOptions chat_options;
    chat_options.max_tool_rounds = config_.llm.max_tool_rounds;
    if (config_.llm.url.has_value()) {
        auto url = ParseHttpUrl(*config_.llm.url);
        if (url.IsOk()) {
            llm = std::make_shared<HttpClient>(url.Value());
            chat_options.completions_path = JoinPath(url.Value().path, "/v1/chat/completions");
        } else {
            LogError("chat", "Ignoring llm.url: " + url.Error().message);
        }
    }
    auto chat = std::make_shared<const ChatForwarder>(std::move(llm), chat_options);

    GatewayOptions gateway_options;
    gateway_options.host = config_.server.host;
    gateway_options.port = config_.server.port;
    gateway_options.public_path = config_.server.public_path;
    gateway_options.cookie_name = config_.server.cookie_name;
    gateway_ = std::make_unique<HttpGateway>(store_, std::move(chat), gateway_options);
    gateway_->SetShutdownHandler([this]() { Stop(); });

    ws_ = std::make_unique<WebSocketServer>(*lifecycle_);
}

RelayApp::~RelayApp() {
    Stop();
    // Joins a /stop.do shutdown still running Stop() before ws_ goes away.
    gateway_.reset();
    ws_.reset();
}

std::shared_ptr<IMcpToolClient> RelayApp::MakeToolClient(
    const std::string& session_id, std::vector<ToolDescriptor> tools) const {
    HttpUrl origin;
    origin.host = LoopbackHost(config_.server.host);
    origin.port = gateway_->Port();
    auto http = std::make_shared<HttpClient>(origin);
    return std::make_shared<McpHttpClient>(
        std::move(http), kMcpPath,
        MakeSessionCookie(config_.server.cookie_name, session_id), std::move(tools));
}

Result<void, Error> RelayApp::Start() {
    auto bound = gateway_->Bind();
    if (bound.IsErr()) {
        return bound;
    }

    WebSocketOptions ws_options;
    ws_options.host = config_.server.host;
    ws_options.port = config_.server.ws_port;
    auto started = ws_->Start(ws_options);
    if (started.IsErr()) {
        gateway_->Stop();
        return started;
    }

    if (config_.sessions.idle_timeout_seconds > 0) {
        eviction_thread_ = std::thread([this]() { EvictionLoop(); });
    }
    return Result<void, Error>::Ok();
}

Result<void, Error> RelayApp::Run() {
    auto served = gateway_->Run();
    Stop();
    return served;
}

void RelayApp::Stop() {
    {
        std::lock_guard<std::mutex> lock(stop_mutex_);
        if (stopping_) {
            return;
        }
        stopping_ = true;
    }
    stop_cv_.notify_all();
    LogInfo("http", "Stopping relay");
    ws_->Stop();
    gateway_->Stop();
    if (eviction_thread_.joinable() &&
        eviction_thread_.get_id() != std::this_thread::get_id()) {
        eviction_thread_.join();
    }
}

void RelayApp::EvictionLoop() {
    const auto max_idle = std::chrono::seconds(config_.sessions.idle_timeout_seconds);
    const auto interval = std::min<std::chrono::milliseconds>(
        max_idle, std::chrono::milliseconds(std::chrono::seconds(60)));

    std::unique_lock<std::mutex> lock(stop_mutex_);
    while (!stop_cv_.wait_for(lock, interval, [this]() { return stopping_; })) {
        lock.unlock();
        const auto removed = store_.EvictIdle(max_idle);
        if (removed > 0) {
            LogInfo("session", "Evicted " + std::to_string(removed) + " idle session(s)");
        }
        lock.lock();
    }
}

} // namespace mcp_relay

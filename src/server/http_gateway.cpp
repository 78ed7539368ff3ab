#include <mcp_relay/server/http_gateway.hpp>

#include <mcp_relay/core/log.hpp>
#include <mcp_relay/server/cookies.hpp>

#include <httplib.h>

#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <regex>
#include <sstream>
#include <thread>

namespace mcp_relay {

namespace fs = std::filesystem;

namespace {

constexpr const char* kTextPlain = "text/plain; charset=UTF-8";
constexpr const char* kTextJson = "text/json";

const std::map<std::string, std::string>& MimeTypes() {
    static const std::map<std::string, std::string> types = {
        {"html", "text/html; charset=UTF-8"},
        {"ico", "image/x-icon"},
        {"js", "text/javascript; charset=UTF-8"},
        {"css", "text/css; charset=UTF-8"},
    };
    return types;
}

GatewayResponse PlainError(int status, const std::string& message) {
    return GatewayResponse{status, message, kTextPlain};
}

GatewayResponse JsonError(const Error& error) {
    return GatewayResponse{error.HttpStatus(), error.ToJson(), "application/json"};
}

std::optional<std::string> CookieOf(const httplib::Request& req) {
    if (!req.has_header("Cookie")) {
        return std::nullopt;
    }
    return req.get_header_value("Cookie");
}

void Send(httplib::Response& res, const GatewayResponse& out) {
    res.status = out.status;
    res.set_content(out.body, out.content_type);
}

} // anonymous namespace

struct HttpGateway::Impl {
    httplib::Server server;
    std::mutex mutex;
    std::function<void()> on_shutdown;
    std::thread shutdown_thread;
    bool bound = false;
};

HttpGateway::HttpGateway(SessionStore& store, std::shared_ptr<const ChatForwarder> chat,
                         GatewayOptions options)
    : store_(store),
      chat_(std::move(chat)),
      options_(std::move(options)),
      impl_(std::make_unique<Impl>()) {
    RegisterRoutes();
}

HttpGateway::~HttpGateway() {
    Stop();
    if (impl_->shutdown_thread.joinable()) {
        impl_->shutdown_thread.join();
    }
}

void HttpGateway::SetShutdownHandler(std::function<void()> handler) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->on_shutdown = std::move(handler);
}

Result<std::string, GatewayResponse> HttpGateway::SessionIdFrom(
    const std::optional<std::string>& cookie) const {
    using R = Result<std::string, GatewayResponse>;
    auto id = ExtractSessionId(cookie, options_.cookie_name);
    if (id.IsErr()) {
        return R::Err(PlainError(400, id.Error().message));
    }
    return R::Ok(id.Value());
}

GatewayResponse HttpGateway::HandleMcp(const std::optional<std::string>& cookie,
                                       const std::string& body) const {
    auto id = SessionIdFrom(cookie);
    if (id.IsErr()) {
        return id.Error();
    }
    auto session = store_.Find(id.Value());
    if (session.IsErr()) {
        return PlainError(400, session.Error().message);
    }

    ScopedLogSession log_session(id.Value());
    auto response = mcp_.HandleBody(body, session.Value()->Tools());
    if (!response.has_value()) {
        return GatewayResponse{202, "", kTextPlain};
    }
    return GatewayResponse{200, *response, "application/json"};
}

GatewayResponse HttpGateway::HandleChat(const std::optional<std::string>& cookie,
                                        const std::string& body) const {
    auto id = SessionIdFrom(cookie);
    if (id.IsErr()) {
        return id.Error();
    }
    auto session = store_.Lookup(id.Value());
    auto client = session ? session->Client() : nullptr;
    if (!client) {
        LogInfo("chat", "Missing mcp-client for user: " + id.Value());
        return PlainError(500, "Missing mcp-client for user");
    }
    session->Touch();
    ScopedLogSession log_session(id.Value());

    if (!chat_ || !chat_->IsConfigured()) {
        return PlainError(503, "No inference endpoint configured");
    }

    auto request = nlohmann::json::parse(body, nullptr, false);
    if (request.is_discarded()) {
        return PlainError(400, "Invalid JSON in chat request");
    }

    auto response = chat_->Forward(std::move(request), *client);
    if (response.IsErr()) {
        return JsonError(response.Error());
    }
    return GatewayResponse{200, response.Value().dump(), "application/json"};
}

GatewayResponse HttpGateway::HandleProps() {
    return GatewayResponse{200, ChatForwarder::Props().dump(), kTextJson};
}

GatewayResponse HttpGateway::HandleSlots() {
    return GatewayResponse{200, ChatForwarder::Slots().dump(), kTextJson};
}

GatewayResponse HttpGateway::HandleStatic(const std::string& raw_path) const {
    static const std::regex valid_path(R"(/([A-Za-z0-9_-]+[.]([A-Za-z0-9]+)))");

    std::string path = raw_path.substr(0, raw_path.find('?'));
    if (path == "/") {
        path = "/index.html";
    }
    std::smatch match;
    if (!std::regex_match(path, match, valid_path)) {
        LogWarn("http", "Invalid path (" + path + ")");
        return PlainError(404, "File not found");
    }
    const auto file_name = match[1].str();
    auto mime = MimeTypes().find(match[2].str());
    if (mime == MimeTypes().end()) {
        LogWarn("http", "Invalid file-type (" + match[2].str() + ") in path (" + path + ")");
        return PlainError(404, "File not found");
    }
    if (!options_.public_path.has_value()) {
        return PlainError(404, "File not found");
    }

    const auto file = fs::path(*options_.public_path) / file_name;
    std::ifstream in(file, std::ios::binary);
    if (!in) {
        LogWarn("http", "Resource (" + path + ") not found in " + *options_.public_path);
        return PlainError(404, "File not found");
    }
    std::ostringstream content;
    content << in.rdbuf();
    return GatewayResponse{200, content.str(), mime->second};
}

void HttpGateway::RegisterRoutes() {
    auto& server = impl_->server;

    server.set_logger([](const httplib::Request& req, const httplib::Response& res) {
        LogInfo("http", req.method + " " + req.path + " -> " + std::to_string(res.status));
    });

    server.Post("/mcp/", [this](const httplib::Request& req, httplib::Response& res) {
        Send(res, HandleMcp(CookieOf(req), req.body));
    });
    server.Get("/chat/props", [](const httplib::Request&, httplib::Response& res) {
        Send(res, HandleProps());
    });
    server.Get("/chat/slots", [](const httplib::Request&, httplib::Response& res) {
        Send(res, HandleSlots());
    });
    server.Post("/chat/v1/chat/completions",
                [this](const httplib::Request& req, httplib::Response& res) {
        Send(res, HandleChat(CookieOf(req), req.body));
    });
    server.Get("/stop.do", [this](const httplib::Request&, httplib::Response& res) {
        Send(res, PlainError(500, "Starting shutdown"));
        LogWarn("http", "Shutdown requested via /stop.do");
        std::lock_guard<std::mutex> lock(impl_->mutex);
        if (impl_->shutdown_thread.joinable()) {
            return;
        }
        auto handler = impl_->on_shutdown;
        impl_->shutdown_thread = std::thread([this, handler]() {
            if (handler) {
                handler();
            } else {
                Stop();
            }
        });
    });
    server.Get("/chat/(.*)", [this](const httplib::Request& req, httplib::Response& res) {
        Send(res, HandleStatic("/" + req.matches[1].str()));
    });
    server.Get("/(.*)", [this](const httplib::Request& req, httplib::Response& res) {
        Send(res, HandleStatic(req.path));
    });
}

Result<void, Error> HttpGateway::Bind() {
    using R = Result<void, Error>;
    int port = options_.port;
    if (port == 0) {
        port = impl_->server.bind_to_any_port(options_.host);
    } else if (!impl_->server.bind_to_port(options_.host, port)) {
        port = -1;
    }
    if (port <= 0) {
        return R::Err(Error::Make(ErrorCategory::Io, "HttpBind",
                                  "Cannot listen on " + options_.host + ":" +
                                  std::to_string(options_.port)));
    }
    bound_port_ = static_cast<uint16_t>(port);
    impl_->bound = true;
    LogInfo("http", "Listening on http://" + options_.host + ":" + std::to_string(bound_port_));
    return R::Ok();
}

Result<void, Error> HttpGateway::Run() {
    using R = Result<void, Error>;
    if (!impl_->bound) {
        return R::Err(Error::Make(ErrorCategory::Internal, "HttpRun", "Run() before Bind()"));
    }
    if (!impl_->server.listen_after_bind()) {
        return R::Err(Error::Make(ErrorCategory::Io, "HttpRun", "HTTP listener failed"));
    }
    LogDebug("http", "Listener stopped");
    return R::Ok();
}

void HttpGateway::Stop() {
    if (impl_->server.is_running()) {
        impl_->server.stop();
    }
}

} // namespace mcp_relay

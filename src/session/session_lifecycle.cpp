#include <mcp_relay/session/session_lifecycle.hpp>

#include <mcp_relay/core/log.hpp>
#include <mcp_relay/relay/live_protocol.hpp>
#include <mcp_relay/relay/relay_tools.hpp>

#include <atomic>
#include <cstdint>

namespace mcp_relay {

namespace {

std::atomic<uint64_t> g_user_counter{0};

constexpr const char* kChatPath = "/chat/";

std::string DefinitionTitle(const nlohmann::json& definition) {
    if (definition.is_object()) {
        auto it = definition.find("title");
        if (it != definition.end() && it->is_string()) {
            return it->get<std::string>();
        }
    }
    return "";
}

} // anonymous namespace

SessionLifecycle::SessionLifecycle(SessionStore& store,
                                   std::shared_ptr<const RelayEngine> engine,
                                   BuiltinCatalog catalog,
                                   ToolClientFactory client_factory)
    : store_(store),
      engine_(std::move(engine)),
      catalog_(std::move(catalog)),
      client_factory_(std::move(client_factory)) {}

std::string SessionLifecycle::CreateInitialUser() {
    return "user_" + std::to_string((g_user_counter.fetch_add(1) + 1) * 7 + 2);
}

std::shared_ptr<ConnectionChannel> SessionLifecycle::OnConnectionOpened(
    std::shared_ptr<ILiveConnection> connection) {
    auto channel = std::make_shared<ConnectionChannel>(std::move(connection));
    LogInfo("lifecycle", "Connection " + channel->Id() + " opened");
    return channel;
}

void SessionLifecycle::OnConnectionClosed(const std::shared_ptr<ConnectionChannel>& channel) {
    if (!channel) {
        return;
    }
    const auto waiting = channel->Answers().Waiters();
    channel->MarkClosed();
    LogInfo("lifecycle", "Connection " + channel->Id() + " closed, " +
            std::to_string(waiting) + " waiting call(s) released");
}

void SessionLifecycle::OnMessage(const std::shared_ptr<ConnectionChannel>& channel,
                                 const std::string& text) {
    auto handled = HandleMessage(channel, text);
    if (handled.IsErr()) {
        const auto& error = handled.Error();
        if (error.category == ErrorCategory::MalformedMessage) {
            LogWarn("lifecycle", "Dropped malformed message on " + channel->Id() +
                    ": " + error.message);
        } else {
            LogError("lifecycle", "Message on " + channel->Id() + " failed: " +
                     error.ToString());
        }
    }
}

Result<void, Error> SessionLifecycle::HandleMessage(
    const std::shared_ptr<ConnectionChannel>& channel, const std::string& text) {
    channel->Touch();

    auto parsed = live::ParseInbound(text);
    if (parsed.IsErr()) {
        return Result<void, Error>::Err(parsed.Error());
    }
    auto message = std::move(parsed).Value();
    ScopedLogSession log_session(message.user_name);

    switch (message.action) {
        case live::InboundAction::InitUser:
            return HandleInitUser(channel, message.user_name);
        case live::InboundAction::StartMcp:
            return HandleStartMcp(channel, message.user_name, message.payload);
        case live::InboundAction::ToolResponse:
            return HandleToolResponse(channel, std::move(message.payload));
        case live::InboundAction::Unknown:
            break;
    }
    LogInfo("lifecycle", "Ignoring unknown action '" + message.action_name + "'");
    return Result<void, Error>::Ok();
}

Result<void, Error> SessionLifecycle::HandleInitUser(
    const std::shared_ptr<ConnectionChannel>& channel, const std::string& user_name) {
    if (!user_name.empty()) {
        store_.Resolve(user_name);
        return Result<void, Error>::Ok();
    }

    auto user_id = CreateInitialUser();
    store_.Resolve(user_id);
    LogInfo("lifecycle", "Assigned session id " + user_id + " on " + channel->Id());
    return channel->Send(live::InitUser(user_id, catalog_.GlossaryEnabled(),
                                        catalog_.InternalToolsEnabled()));
}

Result<void, Error> SessionLifecycle::HandleStartMcp(
    const std::shared_ptr<ConnectionChannel>& channel, const std::string& user_name,
    const nlohmann::json& tool) {
    auto defined = DefineTools(user_name, tool, channel);
    if (defined.IsErr()) {
        Notify(channel, live::Message("Tool definition rejected: " + defined.Error().message));
        return Result<void, Error>::Err(defined.Error());
    }
    return channel->Send(live::UiServerStarted(user_name, kChatPath));
}

Result<void, Error> SessionLifecycle::HandleToolResponse(
    const std::shared_ptr<ConnectionChannel>& channel, nlohmann::json answer) {
    LogDebug("lifecycle", "Answer on " + channel->Id() + ": " + answer.dump());
    channel->Answers().Offer(std::move(answer));
    return Result<void, Error>::Ok();
}

Result<std::shared_ptr<Session>, Error> SessionLifecycle::DefineTools(
    const std::string& session_id,
    const nlohmann::json& definitions,
    const std::shared_ptr<ConnectionChannel>& channel) {
    using R = Result<std::shared_ptr<Session>, Error>;

    if (session_id.empty()) {
        return R::Err(Error::Make(ErrorCategory::MalformedMessage, "DefineTools",
                                  "Missing session id"));
    }

    auto tools = BuildTools(definitions, channel);
    if (tools.IsErr()) {
        return R::Err(tools.Error());
    }

    std::vector<ToolDescriptor> descriptors;
    for (const auto& tool : tools.Value()) {
        descriptors.push_back(tool.descriptor);
    }
    std::shared_ptr<IMcpToolClient> client;
    if (client_factory_) {
        client = client_factory_(session_id, descriptors);
    }

    auto session = store_.Resolve(session_id);
    const auto count = descriptors.size();
    session->InstallToolSet(std::move(tools).Value(), channel, std::move(client));
    LogInfo("lifecycle", "Session " + session_id + " now has " + std::to_string(count) +
            " tool(s) on " + channel->Id());
    return R::Ok(std::move(session));
}

Result<std::vector<Tool>, Error> SessionLifecycle::BuildTools(
    const nlohmann::json& definitions,
    const std::shared_ptr<ConnectionChannel>& channel) const {
    using R = Result<std::vector<Tool>, Error>;

    const auto title = DefinitionTitle(definitions);
    std::weak_ptr<ConnectionChannel> weak = channel;
    std::vector<Tool> tools;

    if (title == kInternalToolsName) {
        Notify(channel, live::ToolDefinition("internal tool",
                                             "We will display the used internal tools here."));
        if (!catalog_.InternalToolsEnabled()) {
            LogWarn("lifecycle", "internal_tools requested but no built-in file tools are configured");
        }
        for (const auto& tool : catalog_.internal_tools) {
            tools.push_back(WrapWithObserver(tool, weak));
        }
        return R::Ok(std::move(tools));
    }

    if (title == kGlossaryDemoName && catalog_.GlossaryEnabled()) {
        auto tool = WrapWithObserver(*catalog_.glossary_tool, weak, std::string("text"));
        Notify(channel, live::ToolDefinition(tool.descriptor));
        tools.push_back(std::move(tool));
        return R::Ok(std::move(tools));
    }

    std::vector<nlohmann::json> list;
    if (definitions.is_array()) {
        list.assign(definitions.begin(), definitions.end());
    } else {
        list.push_back(definitions);
    }

    std::vector<ToolDescriptor> descriptors;
    for (const auto& definition : list) {
        auto descriptor = ToolDescriptorFromDefinition(definition);
        if (descriptor.IsErr()) {
            return R::Err(descriptor.Error());
        }
        descriptors.push_back(std::move(descriptor).Value());
    }
    for (auto& descriptor : descriptors) {
        Notify(channel, live::ToolDefinition(descriptor));
        tools.push_back(MakeRelayTool(std::move(descriptor), weak, engine_));
    }
    return R::Ok(std::move(tools));
}

void SessionLifecycle::Notify(const std::shared_ptr<ConnectionChannel>& channel,
                              const nlohmann::json& message) const {
    auto sent = channel->Send(message);
    if (sent.IsErr()) {
        LogWarn("lifecycle", "Could not send " + message.value("action", std::string()) +
                " to " + channel->Id() + ": " + sent.Error().message);
    }
}

} // namespace mcp_relay

#include <mcp_relay/relay/relay_tools.hpp>

#include <mcp_relay/core/log.hpp>
#include <mcp_relay/relay/live_protocol.hpp>

namespace mcp_relay {

namespace {

void Mirror(const std::shared_ptr<ConnectionChannel>& channel,
            const nlohmann::json& message) {
    if (!channel) {
        return;
    }
    auto sent = channel->Send(message);
    if (sent.IsErr()) {
        LogWarn("relay", "Could not mirror " + message.value("action", std::string()) +
                ": " + sent.Error().message);
    }
}

std::string ResponseText(const ToolResult& result,
                         const std::optional<std::string>& response_field) {
    if (response_field.has_value()) {
        if (result.content.is_array() && !result.content.empty()) {
            const auto& first = result.content.front();
            auto it = first.find(*response_field);
            if (it != first.end()) {
                return it->is_string() ? it->get<std::string>() : it->dump();
            }
        }
        return "";
    }
    return result.content.dump();
}

} // anonymous namespace

Tool MakeRelayTool(ToolDescriptor descriptor,
                   std::weak_ptr<ConnectionChannel> channel,
                   std::shared_ptr<const RelayEngine> engine) {
    auto name = descriptor.name;
    ToolHandler handler =
        [name, channel = std::move(channel), engine = std::move(engine)](
            const nlohmann::json& arguments) -> ToolResult {
            auto live = channel.lock();
            if (!live) {
                LogError("relay", "Delivery of '" + name + "' failed: connection is gone");
                return ToolResult{};
            }
            auto outcome = engine->Call(*live, name, arguments);
            return ToolResult{false, std::move(outcome.content)};
        };
    return Tool{std::move(descriptor), ToolKind::Relay, std::move(handler)};
}

Tool WrapWithObserver(Tool inner,
                      std::weak_ptr<ConnectionChannel> channel,
                      std::optional<std::string> response_field) {
    auto descriptor = inner.descriptor;
    auto inner_handler = std::move(inner.handler);
    ToolHandler handler =
        [descriptor, inner_handler = std::move(inner_handler),
         channel = std::move(channel), response_field = std::move(response_field)](
            const nlohmann::json& arguments) -> ToolResult {
            auto live = channel.lock();
            Mirror(live, live::ToolDefinition(descriptor));
            Mirror(live, live::ToolRequest(arguments));

            auto result = inner_handler(arguments);

            Mirror(live, live::ToolResponse(ResponseText(result, response_field)));
            return result;
        };
    return Tool{std::move(inner.descriptor), ToolKind::Observed, std::move(handler)};
}

} // namespace mcp_relay

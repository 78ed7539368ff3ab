#include <mcp_relay/relay/live_protocol.hpp>

namespace mcp_relay {
namespace live {

namespace {

Error Malformed(const std::string& message) {
    return Error::Make(ErrorCategory::MalformedMessage, "LiveMessage", message);
}

std::string StringField(const nlohmann::json& object, const char* key) {
    auto it = object.find(key);
    if (it != object.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return "";
}

} // anonymous namespace

Result<InboundMessage, Error> ParseInbound(const std::string& text) {
    using R = Result<InboundMessage, Error>;

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        return R::Err(Malformed(std::string("Invalid JSON: ") + e.what()));
    }
    if (!j.is_object()) {
        return R::Err(Malformed("Message is not a JSON object"));
    }

    InboundMessage msg;
    msg.action_name = StringField(j, "action");
    if (msg.action_name.empty()) {
        return R::Err(Malformed("Message has no 'action'"));
    }
    msg.user_name = StringField(j, "userName");

    if (msg.action_name == kInitUser) {
        msg.action = InboundAction::InitUser;
    } else if (msg.action_name == kStartMcp) {
        msg.action = InboundAction::StartMcp;
        if (msg.user_name.empty()) {
            return R::Err(Malformed("startMcp without 'userName'"));
        }
        auto it = j.find("tool");
        if (it == j.end() || !(it->is_object() || it->is_array())) {
            return R::Err(Malformed("startMcp without 'tool' definition"));
        }
        msg.payload = *it;
    } else if (msg.action_name == kToolResponse) {
        msg.action = InboundAction::ToolResponse;
        auto it = j.find("toolResponse");
        if (it == j.end() || !it->is_object()) {
            return R::Err(Malformed("toolResponse without 'toolResponse' object"));
        }
        msg.payload = *it;
    } else {
        msg.action = InboundAction::Unknown;
    }

    return R::Ok(std::move(msg));
}

nlohmann::json ToolCall(const nlohmann::json& params) {
    return {{"action", kToolCall}, {"toolRequest", params}};
}

nlohmann::json ToolDefinition(const ToolDescriptor& descriptor) {
    nlohmann::json j = ToolDefinition(descriptor.name, descriptor.description);
    const auto& props = descriptor.input_schema.properties;
    if (!props.empty()) {
        j["param1Name"] = props[0].name;
        j["param1Description"] = props[0].description;
    }
    if (props.size() >= 2) {
        j["param2Name"] = props[1].name;
        j["param2Description"] = props[1].description;
    }
    return j;
}

nlohmann::json ToolDefinition(const std::string& title,
                              const std::string& description) {
    return {
        {"action", kToolDefinition},
        {"toolTitle", title},
        {"toolDescription", description},
        {"param1Name", ""},
        {"param1Description", ""},
        {"param2Name", ""},
        {"param2Description", ""},
    };
}

nlohmann::json ToolRequest(const nlohmann::json& params) {
    return {{"action", kToolRequest}, {"toolRequest", params.dump()}};
}

nlohmann::json ToolResponse(const std::string& text) {
    return {{"action", kToolResponse}, {"toolResponse", text}};
}

nlohmann::json UiServerStarted(const std::string& user_name,
                               const std::string& chat_path) {
    return {
        {"action", kUiServerStarted},
        {"message", "Hi " + user_name + "! MCP-server has been started."},
        {"url", chat_path},
    };
}

nlohmann::json InitUser(const std::string& user_id, bool glossary_enabled,
                        bool internal_tools_enabled) {
    nlohmann::json j = {
        {"action", kInitUser},
        {"message", "Initial user: " + user_id},
        {"userId", user_id},
    };
    if (glossary_enabled) {
        j["glossaryToolEnabled"] = true;
    }
    if (internal_tools_enabled) {
        j["internalToolsEnabled"] = true;
    }
    return j;
}

nlohmann::json Message(const std::string& text) {
    return {{"action", kMessage}, {"message", text}};
}

} // namespace live
} // namespace mcp_relay

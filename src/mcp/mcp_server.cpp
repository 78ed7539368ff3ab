#include <mcp_relay/mcp/mcp_server.hpp>

#include <mcp_relay/core/log.hpp>
#include <mcp_relay/core/version.hpp>

namespace mcp_relay {

namespace {

constexpr const char* kProtocolVersion = "2024-11-05";

} // anonymous namespace

std::optional<std::string> McpServer::HandleBody(
    const std::string& body, const ToolRegistry& registry) const {
    nlohmann::json message;
    try {
        message = nlohmann::json::parse(body);
    } catch (const nlohmann::json::exception&) {
        LogWarn("mcp", "Unparseable JSON-RPC body");
        return MakeError(nullptr, -32700, "Parse error").dump();
    }

    auto response = HandleMessage(message, registry);
    if (!response) {
        return std::nullopt;
    }
    return response->dump();
}

std::optional<nlohmann::json> McpServer::HandleMessage(
    const nlohmann::json& message, const ToolRegistry& registry) const {
    if (!message.is_object()) {
        return MakeError(nullptr, -32600, "Invalid Request");
    }
    // Check for JSON-RPC 2.0.
    if (!message.contains("jsonrpc") || message["jsonrpc"] != "2.0") {
        if (message.contains("id")) {
            return MakeError(message["id"], -32600, "Invalid JSON-RPC version");
        }
        return std::nullopt;
    }

    // Notifications have no "id".
    bool is_notification = !message.contains("id");
    const auto method_it = message.find("method");
    const auto params_it = message.find("params");
    if (method_it == message.end() || !method_it->is_string() ||
        (params_it != message.end() && !params_it->is_object())) {
        if (is_notification) {
            LogWarn("mcp", "Dropping malformed notification");
            return std::nullopt;
        }
        return MakeError(message["id"], -32600, "Invalid Request");
    }
    auto method = method_it->get<std::string>();
    auto params = params_it == message.end() ? nlohmann::json::object() : *params_it;

    if (is_notification) {
        LogDebug("mcp", "Notification " + method);
        return std::nullopt;
    }

    auto id = message["id"];

    if (method == "initialize") {
        return HandleInitialize(params, id);
    } else if (method == "ping") {
        return MakeResult(id, nlohmann::json::object());
    } else if (method == "tools/list") {
        return HandleToolsList(id, registry);
    } else if (method == "tools/call") {
        return HandleToolsCall(params, id, registry);
    } else {
        return MakeError(id, -32601, "Method not found: " + method);
    }
}

nlohmann::json McpServer::HandleInitialize(
    const nlohmann::json& /*params*/, const nlohmann::json& id) const {
    nlohmann::json result;
    result["protocolVersion"] = kProtocolVersion;
    result["capabilities"] = {
        {"tools", nlohmann::json::object()}
    };
    result["serverInfo"] = {
        {"name", server_name_},
        {"version", kVersion}
    };

    return MakeResult(id, result);
}

nlohmann::json McpServer::HandleToolsList(const nlohmann::json& id,
                                          const ToolRegistry& registry) const {
    nlohmann::json tools = nlohmann::json::array();
    for (const auto& descriptor : registry.ListAll()) {
        tools.push_back(descriptor.ToJson());
    }
    return MakeResult(id, {{"tools", tools}});
}

nlohmann::json McpServer::HandleToolsCall(const nlohmann::json& params,
                                          const nlohmann::json& id,
                                          const ToolRegistry& registry) const {
    if (!params.contains("name") || !params["name"].is_string()) {
        return MakeError(id, -32602, "Missing 'name' parameter");
    }

    auto tool_name = params["name"].get<std::string>();
    auto arguments = params.value("arguments", nlohmann::json::object());

    auto executed = registry.Execute(tool_name, arguments);
    if (executed.IsErr()) {
        LogWarn("mcp", executed.Error().message);
        return MakeError(id, -32602, executed.Error().message);
    }
    const auto& result = executed.Value();

    nlohmann::json response_result;
    response_result["content"] = result.content;
    if (result.is_error) {
        response_result["isError"] = true;
    }

    return MakeResult(id, response_result);
}

nlohmann::json McpServer::MakeError(
    const nlohmann::json& id, int code, const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {
            {"code", code},
            {"message", message}
        }}
    };
}

nlohmann::json McpServer::MakeResult(
    const nlohmann::json& id, const nlohmann::json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

} // namespace mcp_relay

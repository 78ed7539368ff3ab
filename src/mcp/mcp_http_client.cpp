#include <mcp_relay/mcp/mcp_http_client.hpp>

#include <mcp_relay/core/log.hpp>

#include <algorithm>

namespace mcp_relay {

namespace {

Error MakeRpcError(const std::string& endpoint, const std::string& message) {
    auto error = Error::Make(ErrorCategory::Upstream, "McpRpc", message);
    error.endpoint = endpoint;
    return error;
}

std::string ExtractJsonRpcError(const nlohmann::json& resp) {
    if (!resp.contains("error") || !resp["error"].is_object()) return {};
    const auto& e = resp["error"];
    std::string msg;
    if (e.contains("message") && e["message"].is_string()) {
        msg = e["message"].get<std::string>();
    }
    if (msg.empty()) msg = "json-rpc error";
    return msg;
}

} // anonymous namespace

McpHttpClient::McpHttpClient(std::shared_ptr<IHttpClient> http,
                             std::string endpoint_path,
                             std::string session_cookie,
                             std::vector<ToolDescriptor> tools)
    : http_(std::move(http)),
      endpoint_path_(std::move(endpoint_path)),
      session_cookie_(std::move(session_cookie)),
      tools_(std::move(tools)) {}

std::string McpHttpClient::EndpointUrl() const {
    return http_->Origin() + endpoint_path_;
}

nlohmann::json McpHttpClient::OpenAiTools() const {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& tool : tools_) {
        out.push_back({
            {"type", "function"},
            {"function", {
                {"name", tool.name},
                {"description", tool.description},
                {"parameters", tool.input_schema.ToJson()},
            }},
        });
    }
    return out;
}

bool McpHttpClient::HasTool(const std::string& name) const {
    return std::any_of(tools_.begin(), tools_.end(),
                       [&](const ToolDescriptor& t) { return t.name == name; });
}

Result<ToolResult, Error> McpHttpClient::CallTool(const std::string& name,
                                                  const nlohmann::json& arguments) {
    using R = Result<ToolResult, Error>;

    if (!HasTool(name)) {
        return R::Err(Error::Make(ErrorCategory::UnknownTool, "CallTool",
                                  "Tool not registered: " + name));
    }

    auto result = Rpc("tools/call", {{"name", name}, {"arguments", arguments}});
    if (result.IsErr()) {
        return R::Err(result.Error());
    }

    const auto& body = result.Value();
    ToolResult out;
    out.is_error = body.value("isError", false);
    if (body.contains("content") && body["content"].is_array()) {
        out.content = body["content"];
    }
    return R::Ok(std::move(out));
}

Result<nlohmann::json, Error> McpHttpClient::Rpc(const std::string& method,
                                                 const nlohmann::json& params) {
    using R = Result<nlohmann::json, Error>;

    nlohmann::json req = {
        {"jsonrpc", "2.0"},
        {"id", next_id_++},
        {"method", method},
        {"params", params},
    };

    HttpHeaders headers;
    if (!session_cookie_.empty()) {
        headers["Cookie"] = session_cookie_;
    }

    LogDebug("mcp", "-> " + method + " " + EndpointUrl());
    auto res = http_->Post(endpoint_path_, req.dump(), "application/json", headers);
    if (res.IsErr()) {
        return R::Err(res.Error());
    }
    const auto& response = res.Value();
    if (response.status_code < 200 || response.status_code >= 300) {
        return R::Err(Error::FromUpstreamStatus("McpRpc", EndpointUrl(),
                                                response.status_code, response.body));
    }

    auto resp = nlohmann::json::parse(response.body, nullptr, false);
    if (resp.is_discarded() || !resp.is_object()) {
        return R::Err(MakeRpcError(EndpointUrl(), "Invalid JSON-RPC response"));
    }
    auto rpc_err = ExtractJsonRpcError(resp);
    if (!rpc_err.empty()) {
        return R::Err(MakeRpcError(EndpointUrl(), rpc_err));
    }
    if (!resp.contains("result")) {
        return R::Err(MakeRpcError(EndpointUrl(), "JSON-RPC response has no result"));
    }
    return R::Ok(resp["result"]);
}

} // namespace mcp_relay

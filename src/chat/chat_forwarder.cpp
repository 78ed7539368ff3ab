#include <mcp_relay/chat/chat_forwarder.hpp>

#include <mcp_relay/core/log.hpp>

namespace mcp_relay {

namespace {

constexpr size_t kMaxLogChars = 2000;

std::string TruncateForLog(const std::string& s) {
    if (s.size() <= kMaxLogChars) return s;
    return s.substr(0, kMaxLogChars) + "...";
}

// First choice's message, or null when the response has none.
const nlohmann::json* FirstMessage(const nlohmann::json& response) {
    auto choices = response.find("choices");
    if (choices == response.end() || !choices->is_array() || choices->empty()) {
        return nullptr;
    }
    const auto& first = (*choices)[0];
    auto message = first.find("message");
    if (message == first.end() || !message->is_object()) {
        return nullptr;
    }
    return &*message;
}

const nlohmann::json* ToolCalls(const nlohmann::json& message) {
    auto calls = message.find("tool_calls");
    if (calls == message.end() || !calls->is_array() || calls->empty()) {
        return nullptr;
    }
    return &*calls;
}

// OpenAI sends arguments as a JSON string; some servers send an object.
nlohmann::json ParseArguments(const nlohmann::json& function) {
    auto it = function.find("arguments");
    if (it == function.end() || it->is_null()) {
        return nlohmann::json::object();
    }
    if (it->is_string()) {
        const auto& text = it->get_ref<const std::string&>();
        if (text.empty()) {
            return nlohmann::json::object();
        }
        return nlohmann::json::parse(text, nullptr, false);
    }
    return *it;
}

} // anonymous namespace

std::string ContentToText(const nlohmann::json& content) {
    if (!content.is_array()) {
        return content.dump();
    }
    std::string text;
    bool any = false;
    for (const auto& item : content) {
        if (item.is_object() && item.value("type", "") == "text" &&
            item.contains("text") && item["text"].is_string()) {
            if (any) text += "\n";
            text += item["text"].get<std::string>();
            any = true;
        }
    }
    return any ? text : content.dump();
}

ChatForwarder::ChatForwarder(std::shared_ptr<IHttpClient> llm, ChatOptions options)
    : llm_(std::move(llm)), options_(std::move(options)) {}

nlohmann::json ChatForwarder::Props() {
    return {
        {"default_generation_settings", {
            {"n_ctx", 32768},
            {"params", {{"temperature", 0.8}, {"top_p", 0.95}, {"stream", false}}},
        }},
        {"total_slots", 1},
        {"model_path", ""},
        {"chat_template", ""},
        {"modalities", {{"vision", false}, {"audio", false}}},
    };
}

nlohmann::json ChatForwarder::Slots() {
    return nlohmann::json::array({
        {{"id", 0}, {"n_ctx", 32768}, {"speculative", false}, {"is_processing", false}},
    });
}

Result<nlohmann::json, Error> ChatForwarder::Complete(const nlohmann::json& request) const {
    using R = Result<nlohmann::json, Error>;

    const auto endpoint = llm_->Origin() + options_.completions_path;
    auto res = llm_->Post(options_.completions_path, request.dump(), "application/json");
    if (res.IsErr()) {
        auto error = res.Error();
        error.category = ErrorCategory::Upstream;
        error.endpoint = endpoint;
        return R::Err(std::move(error));
    }
    const auto& response = res.Value();
    if (response.status_code < 200 || response.status_code >= 300) {
        return R::Err(Error::FromUpstreamStatus("ChatCompletion", endpoint,
                                                response.status_code, response.body));
    }
    auto parsed = nlohmann::json::parse(response.body, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        auto error = Error::Make(ErrorCategory::Upstream, "ChatCompletion",
                                 "Invalid JSON from inference endpoint");
        error.endpoint = endpoint;
        return R::Err(std::move(error));
    }
    return R::Ok(std::move(parsed));
}

nlohmann::json ChatForwarder::RunToolCall(const nlohmann::json& call,
                                          IMcpToolClient& tools) const {
    const auto id = call.value("id", std::string());
    nlohmann::json function = call.value("function", nlohmann::json::object());
    const auto name = function.value("name", std::string());

    std::string content;
    auto arguments = ParseArguments(function);
    if (arguments.is_discarded()) {
        content = "Tool error: arguments are not valid JSON";
    } else {
        LogInfo("chat", "tool-call id=" + id + " name=" + name + " arguments=" +
                TruncateForLog(arguments.dump()));
        auto result = tools.CallTool(name, arguments);
        if (result.IsErr()) {
            LogWarn("chat", "tool-call " + name + " failed: " + result.Error().ToString());
            content = "Tool error: " + result.Error().message;
        } else {
            content = ContentToText(result.Value().content);
            LogDebug("chat", "tool-result id=" + id + " " + TruncateForLog(content));
        }
    }

    return {
        {"role", "tool"},
        {"tool_call_id", id},
        {"name", name},
        {"content", content},
    };
}

Result<nlohmann::json, Error> ChatForwarder::Forward(nlohmann::json request,
                                                     IMcpToolClient& tools) const {
    using R = Result<nlohmann::json, Error>;

    if (!IsConfigured()) {
        return R::Err(Error::Make(ErrorCategory::Config, "ChatForward",
                                  "No inference endpoint configured"));
    }
    if (!request.is_object() || !request.contains("messages") ||
        !request["messages"].is_array()) {
        return R::Err(Error::Make(ErrorCategory::MalformedMessage, "ChatForward",
                                  "Request has no 'messages' array"));
    }

    request["stream"] = false;
    auto offered = tools.OpenAiTools();
    if (!offered.empty()) {
        request["tools"] = std::move(offered);
    }

    int rounds = 0;
    while (true) {
        auto response = Complete(request);
        if (response.IsErr()) {
            LogError("chat", response.Error().ToString());
            return response;
        }

        const auto* message = FirstMessage(response.Value());
        const auto* calls = message ? ToolCalls(*message) : nullptr;
        if (calls == nullptr) {
            return response;
        }
        if (rounds >= options_.max_tool_rounds) {
            LogWarn("chat", "Tool round limit (" + std::to_string(options_.max_tool_rounds) +
                    ") reached, returning last response");
            return response;
        }
        ++rounds;

        request["messages"].push_back(*message);
        for (const auto& call : *calls) {
            request["messages"].push_back(RunToolCall(call, tools));
        }
    }
}

} // namespace mcp_relay

#include <mcp_relay/core/result.hpp>

#include <nlohmann/json.hpp>

#include <sstream>

namespace mcp_relay {

namespace {

constexpr size_t kMaxDetailChars = 512;

// Pull a readable message out of an upstream response body. OpenAI-style
// services answer {"error":{"message":...}}, others answer plain text.
std::optional<std::string> ExtractUpstreamMessage(const std::string& body) {
    if (body.empty()) return std::nullopt;

    auto parsed = nlohmann::json::parse(body, nullptr, false);
    if (!parsed.is_discarded() && parsed.is_object()) {
        if (parsed.contains("error")) {
            const auto& err = parsed["error"];
            if (err.is_object() && err.contains("message") &&
                err["message"].is_string()) {
                return err["message"].get<std::string>();
            }
            if (err.is_string()) {
                return err.get<std::string>();
            }
        }
        if (parsed.contains("message") && parsed["message"].is_string()) {
            return parsed["message"].get<std::string>();
        }
        return std::nullopt;
    }

    if (body.size() > kMaxDetailChars) {
        return body.substr(0, kMaxDetailChars) + "...";
    }
    return body;
}

} // anonymous namespace

Error Error::Make(ErrorCategory category, std::string operation,
                  std::string message) {
    Error error;
    error.operation = std::move(operation);
    error.message = std::move(message);
    error.category = category;
    return error;
}

Error Error::FromUpstreamStatus(const std::string& operation,
                                const std::string& endpoint,
                                int status_code,
                                const std::string& response_body) {
    std::string message;
    if (status_code == 401 || status_code == 403) {
        message = "Upstream rejected the credentials";
    } else if (status_code == 404) {
        message = "Upstream endpoint not found";
    } else if (status_code == 429) {
        message = "Upstream rate limit exceeded";
    } else if (status_code >= 500) {
        message = "Upstream server error";
    } else {
        message = "Unexpected upstream status";
    }

    Error error;
    error.operation = operation;
    error.endpoint = endpoint;
    error.http_status = status_code;
    error.message = std::move(message);
    error.detail = ExtractUpstreamMessage(response_body);
    error.category = ErrorCategory::Upstream;
    return error;
}

std::string Error::CategoryName() const {
    switch (category) {
        case ErrorCategory::UnknownSession:        return "unknown_session";
        case ErrorCategory::DeliveryFailed:        return "delivery_failed";
        case ErrorCategory::TimedOut:              return "timed_out";
        case ErrorCategory::ConnectionClosed:      return "connection_closed";
        case ErrorCategory::MalformedMessage:      return "malformed_message";
        case ErrorCategory::InvalidToolDefinition: return "invalid_tool_definition";
        case ErrorCategory::UnknownTool:           return "unknown_tool";
        case ErrorCategory::Config:                return "config";
        case ErrorCategory::Io:                    return "io";
        case ErrorCategory::Upstream:              return "upstream";
        case ErrorCategory::Internal:              return "internal";
    }
    return "internal";
}

int Error::HttpStatus() const {
    switch (category) {
        case ErrorCategory::UnknownSession:
        case ErrorCategory::MalformedMessage:
        case ErrorCategory::InvalidToolDefinition:
        case ErrorCategory::UnknownTool:
            return 400;
        case ErrorCategory::Upstream:
            return 502;
        default:
            return 500;
    }
}

int Error::ExitCode() const {
    switch (category) {
        case ErrorCategory::Config: return 2;
        case ErrorCategory::Io:     return 3;
        default:                    return 99;
    }
}

std::string Error::ToString() const {
    std::ostringstream oss;
    oss << operation;
    if (!endpoint.empty()) {
        oss << " [" << endpoint << "]";
    }
    if (http_status.has_value()) {
        oss << " (HTTP " << *http_status << ")";
    }
    oss << ": " << message;
    if (detail.has_value() && !detail->empty()) {
        oss << " (" << *detail << ")";
    }
    return oss.str();
}

std::string Error::ToJson() const {
    nlohmann::json body;
    body["category"] = CategoryName();
    body["operation"] = operation;
    if (!endpoint.empty()) {
        body["endpoint"] = endpoint;
    }
    if (http_status.has_value()) {
        body["http_status"] = *http_status;
    }
    body["message"] = message;
    if (detail.has_value() && !detail->empty()) {
        body["detail"] = *detail;
    }
    return nlohmann::json{{"error", body}}.dump();
}

} // namespace mcp_relay

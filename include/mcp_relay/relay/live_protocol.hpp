#pragma once

#include <mcp_relay/core/result.hpp>
#include <mcp_relay/registry/tool_descriptor.hpp>

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace mcp_relay {

// ---------------------------------------------------------------------------
// Live-connection protocol. Every message is a JSON object with an
// "action" field.
// ---------------------------------------------------------------------------
namespace live {

inline constexpr const char* kInitUser = "initUser";
inline constexpr const char* kStartMcp = "startMcp";
inline constexpr const char* kToolResponse = "toolResponse";
inline constexpr const char* kToolCall = "toolCall";
inline constexpr const char* kToolDefinition = "toolDefinition";
inline constexpr const char* kToolRequest = "toolRequest";
inline constexpr const char* kUiServerStarted = "uiServerStarted";
inline constexpr const char* kMessage = "message";

// Inbound actions understood by the relay.
enum class InboundAction {
    InitUser,
    StartMcp,
    ToolResponse,
    Unknown,
};

struct InboundMessage {
    InboundAction action = InboundAction::Unknown;
    std::string action_name;
    std::string user_name;           // empty when absent
    nlohmann::json payload;          // "tool" (object or array) for startMcp, "toolResponse" for toolResponse
};

// Parse one inbound text frame. Fails with MalformedMessage when the text is
// not a JSON object, has no "action", or lacks the fields its action needs.
Result<InboundMessage, Error> ParseInbound(const std::string& text);

// Outbound notifications.
nlohmann::json ToolCall(const nlohmann::json& params);
nlohmann::json ToolDefinition(const ToolDescriptor& descriptor);
nlohmann::json ToolDefinition(const std::string& title,
                              const std::string& description);
nlohmann::json ToolRequest(const nlohmann::json& params);
nlohmann::json ToolResponse(const std::string& text);
nlohmann::json UiServerStarted(const std::string& user_name,
                               const std::string& chat_path);
nlohmann::json InitUser(const std::string& user_id, bool glossary_enabled,
                        bool internal_tools_enabled);
nlohmann::json Message(const std::string& text);

} // namespace live
} // namespace mcp_relay

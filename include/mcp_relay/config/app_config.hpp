#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace mcp_relay {

struct ServerConfig {
    std::string host = "127.0.0.1";
    uint16_t port = 8090;
    uint16_t ws_port = 8091;
    std::optional<std::string> public_path;  // static web assets
    std::string cookie_name = "MCP_RELAY_USER_ID";
};

struct LlmConfig {
    std::optional<std::string> url;  // OpenAI-compatible inference endpoint
    int max_tool_rounds = 8;
};

struct RelayConfig {
    int deadline_seconds = 60;
    int poll_interval_ms = 1000;
};

struct SessionsConfig {
    int idle_timeout_seconds = 0;  // 0 keeps sessions for the process lifetime
};

struct ToolsConfig {
    std::optional<std::string> project_dir;
    std::optional<std::string> project_filter;  // regex, full match
    std::optional<std::string> glossary_path;
    std::string glossary_description = "Tool to explain technical words or concepts.";
};

struct AppConfig {
    ServerConfig server;
    LlmConfig llm;
    RelayConfig relay;
    SessionsConfig sessions;
    ToolsConfig tools;

    std::optional<std::string> config_file;  // -c/--config
    std::optional<std::string> log_file;
    bool log_json = false;
    int verbosity = 0;  // 0 warn, 1 info (-v), 2 debug (-vv)
};

} // namespace mcp_relay

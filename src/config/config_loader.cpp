#include <mcp_relay/config/config_loader.hpp>

#include <mcp_relay/core/url.hpp>
#include <mcp_relay/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <regex>

namespace mcp_relay {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error::Make(ErrorCategory::Config, "ConfigLoader", message);
}

template <typename T>
void ReadScalar(const YAML::Node& node, const char* key, T& target) {
    if (node[key]) {
        target = node[key].as<T>();
    }
}

void ReadOptional(const YAML::Node& node, const char* key,
                  std::optional<std::string>& target) {
    if (node[key] && !node[key].IsNull()) {
        target = node[key].as<std::string>();
    }
}

uint16_t ToPort(int value, const char* flag) {
    if (value < 0 || value > 65535) {
        throw std::runtime_error(std::string("Invalid ") + flag + ": " + std::to_string(value));
    }
    return static_cast<uint16_t>(value);
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(std::string(file_path));
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }

    AppConfig config;
    config.config_file = std::string(file_path);

    try {
        // -- Server --
        if (const auto server = root["server"]) {
            ReadScalar(server, "host", config.server.host);
            ReadScalar(server, "port", config.server.port);
            ReadScalar(server, "ws_port", config.server.ws_port);
            ReadOptional(server, "public_path", config.server.public_path);
            ReadScalar(server, "cookie_name", config.server.cookie_name);
        }

        // -- LLM --
        if (const auto llm = root["llm"]) {
            ReadOptional(llm, "url", config.llm.url);
            ReadScalar(llm, "max_tool_rounds", config.llm.max_tool_rounds);
        }

        // -- Relay --
        if (const auto relay = root["relay"]) {
            ReadScalar(relay, "deadline_seconds", config.relay.deadline_seconds);
            ReadScalar(relay, "poll_interval_ms", config.relay.poll_interval_ms);
        }

        // -- Sessions --
        if (const auto sessions = root["sessions"]) {
            ReadScalar(sessions, "idle_timeout_seconds",
                       config.sessions.idle_timeout_seconds);
        }

        // -- Tools --
        if (const auto tools = root["tools"]) {
            ReadOptional(tools, "project_dir", config.tools.project_dir);
            ReadOptional(tools, "project_filter", config.tools.project_filter);
            ReadOptional(tools, "glossary_path", config.tools.glossary_path);
            ReadScalar(tools, "glossary_description", config.tools.glossary_description);
        }

        // -- Options --
        ReadOptional(root, "log_file", config.log_file);
        ReadScalar(root, "log_json", config.log_json);
        if (root["verbose"]) {
            config.verbosity = root["verbose"].as<bool>() ? 1 : 0;
        }
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Invalid value in " + std::string(file_path) + ": " + e.what()));
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("mcp-relay", kVersion);

    // Server flags
    program.add_argument("--host")
        .help("Bind address of the HTTP surface");
    program.add_argument("--port")
        .help("HTTP port (MCP endpoint, chat, static files)")
        .scan<'i', int>();
    program.add_argument("--ws-port")
        .help("WebSocket port of the operator connection")
        .scan<'i', int>();
    program.add_argument("--public-path")
        .help("Directory of static web assets");
    program.add_argument("--cookie-name")
        .help("Cookie carrying the session id");

    // Upstream
    program.add_argument("--llm-url")
        .help("Base URL of the OpenAI-compatible inference endpoint");

    // Relay
    program.add_argument("--deadline")
        .help("Seconds to wait for an operator answer")
        .scan<'i', int>();

    // Built-in tools
    program.add_argument("--project-dir")
        .help("Base directory of the built-in file tools");
    program.add_argument("--glossary")
        .help("Markdown glossary enabling the glossary demo tool");

    // Options
    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--log-file")
        .help("Write JSON log lines to this file");
    program.add_argument("--log-json")
        .help("Log JSON lines to stderr")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-v", "--verbose")
        .help("Info output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-vv")
        .help("Debug output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--color")
        .help("Force colored log output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-color")
        .help("Disable colored log output")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::runtime_error& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    AppConfig config;
    try {
        if (auto val = program.present("--host")) {
            config.server.host = *val;
        }
        if (auto val = program.present<int>("--port")) {
            config.server.port = ToPort(*val, "--port");
        }
        if (auto val = program.present<int>("--ws-port")) {
            config.server.ws_port = ToPort(*val, "--ws-port");
        }
        if (auto val = program.present("--public-path")) {
            config.server.public_path = *val;
        }
        if (auto val = program.present("--cookie-name")) {
            config.server.cookie_name = *val;
        }
    } catch (const std::runtime_error& e) {
        return Result<AppConfig, Error>::Err(MakeConfigError(e.what()));
    }

    if (auto val = program.present("--llm-url")) {
        config.llm.url = *val;
    }
    if (auto val = program.present<int>("--deadline")) {
        config.relay.deadline_seconds = *val;
    }
    if (auto val = program.present("--project-dir")) {
        config.tools.project_dir = *val;
    }
    if (auto val = program.present("--glossary")) {
        config.tools.glossary_path = *val;
    }

    if (auto val = program.present("--config")) {
        config.config_file = *val;
    }
    if (auto val = program.present("--log-file")) {
        config.log_file = *val;
    }
    if (program.get<bool>("--log-json")) {
        config.log_json = true;
    }
    if (program.get<bool>("-vv")) {
        config.verbosity = 2;
    } else if (program.get<bool>("--verbose")) {
        config.verbosity = 1;
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides) {
    const AppConfig defaults;
    AppConfig merged = yaml_base;

    // Server overrides
    if (cli_overrides.server.host != defaults.server.host) {
        merged.server.host = cli_overrides.server.host;
    }
    if (cli_overrides.server.port != defaults.server.port) {
        merged.server.port = cli_overrides.server.port;
    }
    if (cli_overrides.server.ws_port != defaults.server.ws_port) {
        merged.server.ws_port = cli_overrides.server.ws_port;
    }
    if (cli_overrides.server.public_path.has_value()) {
        merged.server.public_path = cli_overrides.server.public_path;
    }
    if (cli_overrides.server.cookie_name != defaults.server.cookie_name) {
        merged.server.cookie_name = cli_overrides.server.cookie_name;
    }

    if (cli_overrides.llm.url.has_value()) {
        merged.llm.url = cli_overrides.llm.url;
    }
    if (cli_overrides.relay.deadline_seconds != defaults.relay.deadline_seconds) {
        merged.relay.deadline_seconds = cli_overrides.relay.deadline_seconds;
    }
    if (cli_overrides.tools.project_dir.has_value()) {
        merged.tools.project_dir = cli_overrides.tools.project_dir;
    }
    if (cli_overrides.tools.glossary_path.has_value()) {
        merged.tools.glossary_path = cli_overrides.tools.glossary_path;
    }

    // Options
    if (cli_overrides.config_file.has_value()) {
        merged.config_file = cli_overrides.config_file;
    }
    if (cli_overrides.log_file.has_value()) {
        merged.log_file = cli_overrides.log_file;
    }
    if (cli_overrides.log_json) {
        merged.log_json = true;
    }
    if (cli_overrides.verbosity > merged.verbosity) {
        merged.verbosity = cli_overrides.verbosity;
    }

    return merged;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    using R = Result<void, Error>;

    if (config.server.host.empty()) {
        return R::Err(MakeConfigError("Missing required field: server.host"));
    }
    if (config.server.port == 0) {
        return R::Err(MakeConfigError("Invalid port: 0"));
    }
    if (config.server.ws_port == 0) {
        return R::Err(MakeConfigError("Invalid ws_port: 0"));
    }
    if (config.server.port == config.server.ws_port) {
        return R::Err(MakeConfigError("port and ws_port must differ, both are " +
                                      std::to_string(config.server.port)));
    }
    if (config.server.cookie_name.empty()) {
        return R::Err(MakeConfigError("Missing required field: server.cookie_name"));
    }
    if (config.server.public_path.has_value() &&
        !std::filesystem::is_directory(*config.server.public_path)) {
        return R::Err(MakeConfigError("Illegal path directory (web-content): " +
                                      *config.server.public_path));
    }
    if (config.relay.deadline_seconds <= 0) {
        return R::Err(MakeConfigError("Deadline must be positive, got " +
                                      std::to_string(config.relay.deadline_seconds)));
    }
    if (config.relay.poll_interval_ms <= 0) {
        return R::Err(MakeConfigError("Poll interval must be positive, got " +
                                      std::to_string(config.relay.poll_interval_ms)));
    }
    if (config.relay.poll_interval_ms > config.relay.deadline_seconds * 1000) {
        return R::Err(MakeConfigError("Poll interval must not exceed the deadline"));
    }
    if (config.llm.url.has_value()) {
        auto url = ParseHttpUrl(*config.llm.url);
        if (url.IsErr()) {
            return R::Err(MakeConfigError("Invalid llm.url: " + url.Error().message));
        }
    }
    if (config.llm.max_tool_rounds <= 0) {
        return R::Err(MakeConfigError("max_tool_rounds must be positive, got " +
                                      std::to_string(config.llm.max_tool_rounds)));
    }
    if (config.sessions.idle_timeout_seconds < 0) {
        return R::Err(MakeConfigError("idle_timeout_seconds must not be negative"));
    }
    if (config.tools.project_filter.has_value()) {
        try {
            std::regex compiled(*config.tools.project_filter);
        } catch (const std::regex_error& e) {
            return R::Err(MakeConfigError("Invalid regex in tools.project_filter: " +
                                          std::string(e.what())));
        }
    }

    return R::Ok();
}

} // namespace mcp_relay

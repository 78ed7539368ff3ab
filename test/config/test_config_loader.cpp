#include <catch2/catch_test_macros.hpp>

#include <mcp_relay/config/config_loader.hpp>

#include <filesystem>
#include <string>

using namespace mcp_relay;

// ===========================================================================
// Helper: path to test data files
// ===========================================================================

namespace {

std::string TestDataPath(const std::string& filename) {
    std::string this_file = __FILE__;
    auto last_slash = this_file.rfind('/');
    auto test_dir = this_file.substr(0, last_slash);
    auto test_root = test_dir.substr(0, test_dir.rfind('/'));
    return test_root + "/testdata/" + filename;
}

AppConfig ValidConfig() {
    AppConfig config;
    config.server.port = 8090;
    config.server.ws_port = 8091;
    return config;
}

} // anonymous namespace

// ===========================================================================
// LoadFromYaml
// ===========================================================================

TEST_CASE("LoadFromYaml: valid full config", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("valid_config.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.server.host == "0.0.0.0");
    CHECK(config.server.port == 9090);
    CHECK(config.server.ws_port == 9091);
    CHECK(config.server.cookie_name == "PLAYGROUND_USER");
    REQUIRE(config.llm.url.has_value());
    CHECK(*config.llm.url == "http://127.0.0.1:8080");
    CHECK(config.llm.max_tool_rounds == 4);
    CHECK(config.relay.deadline_seconds == 30);
    CHECK(config.relay.poll_interval_ms == 500);
    CHECK(config.sessions.idle_timeout_seconds == 3600);
    CHECK(config.tools.project_dir == std::optional<std::string>("/srv/projects"));
    CHECK(config.tools.project_filter == std::optional<std::string>("[a-z]+"));
    CHECK(config.tools.glossary_path == std::optional<std::string>("/srv/glossary.md"));
    CHECK(config.log_json);
    CHECK(config.verbosity == 1);
    CHECK(config.config_file == std::optional<std::string>(TestDataPath("valid_config.yaml")));
}

TEST_CASE("LoadFromYaml: minimal config keeps defaults", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("minimal_config.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.server.port == 7000);
    CHECK(config.server.ws_port == 7001);
    CHECK(config.server.host == "127.0.0.1");
    CHECK(config.server.cookie_name == "MCP_RELAY_USER_ID");
    CHECK_FALSE(config.llm.url.has_value());
    CHECK(config.relay.deadline_seconds == 60);
    CHECK(config.relay.poll_interval_ms == 1000);
    CHECK(config.sessions.idle_timeout_seconds == 0);
}

TEST_CASE("LoadFromYaml: nonexistent file", "[config][yaml]") {
    auto result = LoadFromYaml("/nonexistent/path/config.yaml");
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
    CHECK(result.Error().operation == "ConfigLoader");
}

TEST_CASE("LoadFromYaml: syntax error", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("invalid_config.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
}

TEST_CASE("LoadFromYaml: wrong value type", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("bad_value_config.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("Invalid value") != std::string::npos);
}

// ===========================================================================
// LoadFromCli
// ===========================================================================

TEST_CASE("LoadFromCli: no flags gives defaults", "[config][cli]") {
    const char* argv[] = {"mcp-relay"};
    auto result = LoadFromCli(1, argv);
    REQUIRE(result.IsOk());
    CHECK(result.Value().server.port == 8090);
    CHECK(result.Value().server.ws_port == 8091);
    CHECK(result.Value().verbosity == 0);
}

TEST_CASE("LoadFromCli: all flags", "[config][cli]") {
    const char* argv[] = {
        "mcp-relay",
        "--host", "0.0.0.0",
        "--port", "9000",
        "--ws-port", "9001",
        "--public-path", "/srv/www",
        "--cookie-name", "UID",
        "--llm-url", "http://llm:8080",
        "--deadline", "15",
        "--project-dir", "/srv/projects",
        "--glossary", "/srv/glossary.md",
        "-c", "relay.yaml",
        "--log-file", "/tmp/relay.log",
        "--log-json",
        "-vv",
    };
    int argc = sizeof(argv) / sizeof(argv[0]);

    auto result = LoadFromCli(argc, argv);
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.server.host == "0.0.0.0");
    CHECK(config.server.port == 9000);
    CHECK(config.server.ws_port == 9001);
    CHECK(config.server.public_path == std::optional<std::string>("/srv/www"));
    CHECK(config.server.cookie_name == "UID");
    CHECK(config.llm.url == std::optional<std::string>("http://llm:8080"));
    CHECK(config.relay.deadline_seconds == 15);
    CHECK(config.tools.project_dir == std::optional<std::string>("/srv/projects"));
    CHECK(config.tools.glossary_path == std::optional<std::string>("/srv/glossary.md"));
    CHECK(config.config_file == std::optional<std::string>("relay.yaml"));
    CHECK(config.log_file == std::optional<std::string>("/tmp/relay.log"));
    CHECK(config.log_json);
    CHECK(config.verbosity == 2);
}

TEST_CASE("LoadFromCli: port out of range", "[config][cli]") {
    const char* argv[] = {"mcp-relay", "--port", "70000"};
    auto result = LoadFromCli(3, argv);
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
}

TEST_CASE("LoadFromCli: unknown flag", "[config][cli]") {
    const char* argv[] = {"mcp-relay", "--frobnicate"};
    auto result = LoadFromCli(2, argv);
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("CLI parse error") != std::string::npos);
}

// ===========================================================================
// MergeConfigs
// ===========================================================================

TEST_CASE("MergeConfigs: CLI overrides YAML, defaults do not", "[config][merge]") {
    auto yaml = LoadFromYaml(TestDataPath("valid_config.yaml"));
    REQUIRE(yaml.IsOk());

    const char* argv[] = {"mcp-relay", "--port", "7777", "--deadline", "5"};
    auto cli = LoadFromCli(5, argv);
    REQUIRE(cli.IsOk());

    auto merged = MergeConfigs(yaml.Value(), cli.Value());
    CHECK(merged.server.port == 7777);
    CHECK(merged.relay.deadline_seconds == 5);
    CHECK(merged.server.ws_port == 9091);
    CHECK(merged.server.host == "0.0.0.0");
    CHECK(merged.relay.poll_interval_ms == 500);
    CHECK(merged.llm.url == std::optional<std::string>("http://127.0.0.1:8080"));
}

// ===========================================================================
// ValidateConfig
// ===========================================================================

TEST_CASE("ValidateConfig: defaults are valid", "[config][validate]") {
    CHECK(ValidateConfig(ValidConfig()).IsOk());
}

TEST_CASE("ValidateConfig: rejects zero and equal ports", "[config][validate]") {
    auto config = ValidConfig();
    config.server.port = 0;
    CHECK(ValidateConfig(config).IsErr());

    config = ValidConfig();
    config.server.ws_port = 0;
    CHECK(ValidateConfig(config).IsErr());

    config = ValidConfig();
    config.server.ws_port = config.server.port;
    CHECK(ValidateConfig(config).IsErr());
}

TEST_CASE("ValidateConfig: relay timing", "[config][validate]") {
    auto config = ValidConfig();
    config.relay.deadline_seconds = 0;
    CHECK(ValidateConfig(config).IsErr());

    config = ValidConfig();
    config.relay.poll_interval_ms = 0;
    CHECK(ValidateConfig(config).IsErr());

    config = ValidConfig();
    config.relay.deadline_seconds = 1;
    config.relay.poll_interval_ms = 1500;
    CHECK(ValidateConfig(config).IsErr());
}

TEST_CASE("ValidateConfig: public_path must be a directory", "[config][validate]") {
    auto config = ValidConfig();
    config.server.public_path = "/nonexistent/web-content";
    auto result = ValidateConfig(config);
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("web-content") != std::string::npos);

    config.server.public_path = std::filesystem::temp_directory_path().string();
    CHECK(ValidateConfig(config).IsOk());
}

TEST_CASE("ValidateConfig: llm settings", "[config][validate]") {
    auto config = ValidConfig();
    config.llm.max_tool_rounds = 0;
    CHECK(ValidateConfig(config).IsErr());

    config = ValidConfig();
    config.llm.url = "not a url";
    CHECK(ValidateConfig(config).IsErr());
}

TEST_CASE("ValidateConfig: negative idle timeout", "[config][validate]") {
    auto config = ValidConfig();
    config.sessions.idle_timeout_seconds = -1;
    CHECK(ValidateConfig(config).IsErr());
}

TEST_CASE("ValidateConfig: invalid project filter regex", "[config][validate]") {
    auto config = ValidConfig();
    config.tools.project_filter = "([a-z";
    auto result = ValidateConfig(config);
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
}

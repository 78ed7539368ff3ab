#include <mcp_relay/config/config_loader.hpp>
#include <mcp_relay/core/log.hpp>
#include <mcp_relay/core/version.hpp>
#include <mcp_relay/server/relay_app.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>

namespace {

constexpr int kExitSuccess = 0;

void PrintError(const mcp_relay::Error& error, bool json) {
    if (json) {
        std::cerr << error.ToJson() << "\n";
    } else {
        std::cerr << "Error: " << error.ToString() << "\n";
    }
}

// --version is answered before argparse sees the arguments.
bool HandleVersionFlag(int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        if (std::string_view{argv[i]} == "--version") {
            std::cout << "mcp-relay " << mcp_relay::kVersion << "\n";
            return true;
        }
    }
    return false;
}

// The sink outlives main()'s locals; JsonSink only keeps a reference.
std::ofstream& LogFileStream() {
    static std::ofstream stream;
    return stream;
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace mcp_relay;

    if (HandleVersionFlag(argc, argv)) {
        return kExitSuccess;
    }

    // Logging is set up before config parsing so config errors are logged
    // at the requested level.
    auto log_level = LogLevel::Warn;
    bool force_color = false;
    bool force_no_color = false;
    for (int i = 1; i < argc; ++i) {
        auto arg = std::string_view{argv[i]};
        if (arg == "-vv") { log_level = LogLevel::Debug; }
        else if (arg == "-v" || arg == "--verbose") { log_level = LogLevel::Info; }
        else if (arg == "--color") { force_color = true; }
        else if (arg == "--no-color") { force_no_color = true; }
    }
    bool use_color = !force_no_color && (force_color || StderrSupportsColor());
    InitGlobalLogger(std::make_unique<TextSink>(use_color), log_level);

    auto cli_result = LoadFromCli(argc, argv);
    if (cli_result.IsErr()) {
        PrintError(cli_result.Error(), false);
        return cli_result.Error().ExitCode();
    }
    auto cli_config = std::move(cli_result).Value();

    AppConfig config;
    if (cli_config.config_file.has_value()) {
        auto yaml_result = LoadFromYaml(*cli_config.config_file);
        if (yaml_result.IsErr()) {
            PrintError(yaml_result.Error(), cli_config.log_json);
            return yaml_result.Error().ExitCode();
        }
        config = MergeConfigs(std::move(yaml_result).Value(), cli_config);
    } else {
        config = std::move(cli_config);
    }

    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        PrintError(valid.Error(), config.log_json);
        return valid.Error().ExitCode();
    }

    // Final sink: the config file may have asked for JSON or a log file.
    if (config.verbosity >= 2) {
        log_level = LogLevel::Debug;
    } else if (config.verbosity == 1 && log_level == LogLevel::Warn) {
        log_level = LogLevel::Info;
    }
    if (config.log_file.has_value()) {
        auto& stream = LogFileStream();
        stream.open(*config.log_file, std::ios::app);
        if (!stream) {
            auto error = Error::Make(ErrorCategory::Io, "LogFile",
                                     "Cannot open log file: " + *config.log_file);
            PrintError(error, config.log_json);
            return error.ExitCode();
        }
        InitGlobalLogger(std::make_unique<JsonSink>(stream), log_level);
    } else if (config.log_json) {
        InitGlobalLogger(std::make_unique<JsonSink>(std::cerr), log_level);
    } else {
        InitGlobalLogger(std::make_unique<TextSink>(use_color), log_level);
    }

    auto app = RelayApp::Create(config);
    if (app.IsErr()) {
        PrintError(app.Error(), config.log_json);
        return app.Error().ExitCode();
    }
    auto relay = std::move(app).Value();

    auto started = relay->Start();
    if (started.IsErr()) {
        PrintError(started.Error(), config.log_json);
        return started.Error().ExitCode();
    }
    LogInfo("http", "mcp-relay " + std::string(kVersion) + " ready: http port " +
            std::to_string(relay->HttpPort()) + ", ws port " +
            std::to_string(relay->WsPort()));

    auto served = relay->Run();
    if (served.IsErr()) {
        PrintError(served.Error(), config.log_json);
        return served.Error().ExitCode();
    }
    return kExitSuccess;
}

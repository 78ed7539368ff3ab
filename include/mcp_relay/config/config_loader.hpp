#pragma once

#include <mcp_relay/config/app_config.hpp>
#include <mcp_relay/core/result.hpp>

#include <string_view>

namespace mcp_relay {

// Parse a YAML config file into an AppConfig.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse CLI arguments into an AppConfig. Fields not given keep their
// defaults.
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv);

// Merge two configs: fields of cli_overrides that differ from the defaults
// replace those in yaml_base.
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides);

// Validate value ranges and referenced paths.
Result<void, Error> ValidateConfig(const AppConfig& config);

} // namespace mcp_relay

#pragma once

#include <mcp_relay/config/app_config.hpp>
#include <mcp_relay/core/result.hpp>
#include <mcp_relay/registry/tool_registry.hpp>

#include <optional>
#include <vector>

namespace mcp_relay {

// ---------------------------------------------------------------------------
// BuiltinCatalog — the Direct tools installed by the reserved tool-set names.
// ---------------------------------------------------------------------------
struct BuiltinCatalog {
    std::vector<Tool> internal_tools;   // "internal_tools"
    std::optional<Tool> glossary_tool;  // "glossary_tool_demo"

    [[nodiscard]] bool InternalToolsEnabled() const noexcept { return !internal_tools.empty(); }
    [[nodiscard]] bool GlossaryEnabled() const noexcept { return glossary_tool.has_value(); }
};

// File tools are included when a project directory is configured, the
// glossary tool when a glossary path is configured and readable.
Result<BuiltinCatalog, Error> BuildBuiltinCatalog(const ToolsConfig& config);

} // namespace mcp_relay

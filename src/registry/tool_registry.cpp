#include <mcp_relay/registry/tool_registry.hpp>

#include <mcp_relay/core/log.hpp>

namespace mcp_relay {

const char* ToolKindName(ToolKind kind) {
    switch (kind) {
        case ToolKind::Direct:   return "direct";
        case ToolKind::Relay:    return "relay";
        case ToolKind::Observed: return "observed";
    }
    return "unknown";
}

Tool MakeDirectTool(ToolDescriptor descriptor, ToolHandler handler) {
    return Tool{std::move(descriptor), ToolKind::Direct, std::move(handler)};
}

nlohmann::json TextContent(const std::string& text) {
    return {{"type", "text"}, {"text", text}};
}

ToolResult TextResult(const std::string& text, bool is_error) {
    return ToolResult{is_error, nlohmann::json::array({TextContent(text)})};
}

// ---------------------------------------------------------------------------
// ToolRegistry
// ---------------------------------------------------------------------------
ToolRegistry::ToolRegistry() : tools_(std::make_shared<const ToolMap>()) {}

void ToolRegistry::ReplaceAll(std::vector<Tool> tools) {
    auto next = std::make_shared<ToolMap>();
    for (auto& tool : tools) {
        auto name = tool.Name();
        if (next->count(name) > 0) {
            LogWarn("registry", "Duplicate tool '" + name + "', keeping the last definition");
        }
        (*next)[name] = std::make_shared<const Tool>(std::move(tool));
    }
    const auto count = next->size();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tools_ = std::move(next);
    }
    LogDebug("registry", "Installed " + std::to_string(count) + " tool(s)");
}

std::shared_ptr<const ToolRegistry::ToolMap> ToolRegistry::Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tools_;
}

std::shared_ptr<const Tool> ToolRegistry::Get(const std::string& name) const {
    auto snapshot = Snapshot();
    auto it = snapshot->find(name);
    if (it == snapshot->end()) {
        return nullptr;
    }
    return it->second;
}

std::vector<ToolDescriptor> ToolRegistry::ListAll() const {
    auto snapshot = Snapshot();
    std::vector<ToolDescriptor> out;
    out.reserve(snapshot->size());
    for (const auto& [name, tool] : *snapshot) {
        out.push_back(tool->descriptor);
    }
    return out;
}

size_t ToolRegistry::Size() const {
    return Snapshot()->size();
}

Result<ToolResult, Error> ToolRegistry::Execute(const std::string& name,
                                                const nlohmann::json& arguments) const {
    using R = Result<ToolResult, Error>;

    auto tool = Get(name);
    if (!tool) {
        return R::Err(Error::Make(ErrorCategory::UnknownTool, "ExecuteTool",
                                  "Unknown tool: " + name));
    }
    if (!tool->handler) {
        return R::Ok(TextResult("Tool has no handler: " + name, true));
    }

    LogDebug("registry", "Executing " + name + " (" + ToolKindName(tool->kind) + ")");
    try {
        return R::Ok(tool->handler(arguments));
    } catch (const std::exception& e) {
        LogError("registry", "Tool '" + name + "' threw: " + e.what());
        return R::Ok(TextResult(std::string("Tool error: ") + e.what(), true));
    }
}

} // namespace mcp_relay

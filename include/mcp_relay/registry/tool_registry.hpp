#pragma once

#include <mcp_relay/core/result.hpp>
#include <mcp_relay/registry/tool_descriptor.hpp>

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_relay {

// ---------------------------------------------------------------------------
// ToolResult — result of executing a tool.
// ---------------------------------------------------------------------------
struct ToolResult {
    bool is_error = false;
    nlohmann::json content = nlohmann::json::array();  // array of content blocks

    [[nodiscard]] nlohmann::json ToJson() const {
        return {{"content", content}, {"isError", is_error}};
    }
};

// A tool handler takes a JSON arguments object and returns a ToolResult.
using ToolHandler = std::function<ToolResult(const nlohmann::json& arguments)>;

// How a tool produces its result.
enum class ToolKind {
    Direct,    // local logic
    Relay,     // answered by the operator over the live connection
    Observed,  // a Direct tool whose calls are mirrored to the live connection
};

const char* ToolKindName(ToolKind kind);

// ---------------------------------------------------------------------------
// Tool — a descriptor bound to a call behaviour. Immutable once registered.
// ---------------------------------------------------------------------------
struct Tool {
    ToolDescriptor descriptor;
    ToolKind kind = ToolKind::Direct;
    ToolHandler handler;

    [[nodiscard]] const std::string& Name() const noexcept { return descriptor.name; }
};

Tool MakeDirectTool(ToolDescriptor descriptor, ToolHandler handler);

// Single text content item, the shape most tools answer with.
nlohmann::json TextContent(const std::string& text);
ToolResult TextResult(const std::string& text, bool is_error = false);

// ---------------------------------------------------------------------------
// ToolRegistry — the tool set of one session.
//
// The set is held as an immutable snapshot; ReplaceAll() publishes a new
// snapshot under the lock. Readers copy the snapshot pointer,
// so a lookup sees either the old or the new set and a handler already
// obtained keeps running after the set is replaced.
// ---------------------------------------------------------------------------
class ToolRegistry {
public:
    using ToolMap = std::map<std::string, std::shared_ptr<const Tool>>;

    ToolRegistry();

    // Discard the current set and install `tools`. For duplicate names the
    // last definition wins.
    void ReplaceAll(std::vector<Tool> tools);

    [[nodiscard]] std::shared_ptr<const Tool> Get(const std::string& name) const;
    [[nodiscard]] std::vector<ToolDescriptor> ListAll() const;
    [[nodiscard]] size_t Size() const;

    // Snapshot of the whole set, consistent for a single read.
    [[nodiscard]] std::shared_ptr<const ToolMap> Snapshot() const;

    // Run the named tool, looked up once. Unknown tools are an UnknownTool
    // error; a throwing handler yields an isError result.
    [[nodiscard]] Result<ToolResult, Error> Execute(const std::string& name,
                                                    const nlohmann::json& arguments) const;

private:
    mutable std::mutex mutex_;
    std::shared_ptr<const ToolMap> tools_;
};

} // namespace mcp_relay

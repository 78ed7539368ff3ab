#pragma once

#include <mcp_relay/core/result.hpp>

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_relay {

// ---------------------------------------------------------------------------
// ToolProperty — one input property of a tool.
// ---------------------------------------------------------------------------
struct ToolProperty {
    std::string name;
    std::string type;
    std::string description;
    std::optional<std::string> items_type;  // element type of "array" properties
};

// ---------------------------------------------------------------------------
// ToolInputSchema — ordered properties plus the set of required names.
// ---------------------------------------------------------------------------
struct ToolInputSchema {
    std::string type = "object";
    std::vector<ToolProperty> properties;
    std::vector<std::string> required;

    [[nodiscard]] const ToolProperty* Find(const std::string& name) const;
    [[nodiscard]] bool IsRequired(const std::string& name) const;

    // JSON Schema rendering used by tools/list.
    [[nodiscard]] nlohmann::json ToJson() const;
};

// ---------------------------------------------------------------------------
// ToolDescriptor — immutable description of a tool.
// ---------------------------------------------------------------------------
struct ToolDescriptor {
    std::string name;
    std::string title;
    std::string description;
    ToolInputSchema input_schema;

    [[nodiscard]] nlohmann::json ToJson() const;
};

// Build a descriptor from an operator-supplied definition:
//   {"title": "...", "description": "...",
//    "properties": {"<name>": {"type": "...", "description": "...",
//                              "itemsType": "..."}}}
// The title doubles as the tool name. Every property is required.
Result<ToolDescriptor, Error> ToolDescriptorFromDefinition(
    const nlohmann::json& definition);

// Convenience builder for tools defined in code.
class ToolDescriptorBuilder {
public:
    ToolDescriptorBuilder(std::string name, std::string title,
                          std::string description);

    ToolDescriptorBuilder& Property(std::string name, std::string type,
                                    std::string description,
                                    bool required = true);
    ToolDescriptorBuilder& ArrayProperty(std::string name,
                                         std::string items_type,
                                         std::string description,
                                         bool required = true);

    [[nodiscard]] ToolDescriptor Build() const { return descriptor_; }

private:
    ToolDescriptor descriptor_;
};

} // namespace mcp_relay

#include <mcp_relay/registry/tool_descriptor.hpp>

#include <algorithm>

namespace mcp_relay {

namespace {

Error MakeDefinitionError(const std::string& message) {
    return Error::Make(ErrorCategory::InvalidToolDefinition,
                       "ToolDefinition", message);
}

std::string OptionalString(const nlohmann::json& object, const char* key) {
    if (object.contains(key) && object[key].is_string()) {
        return object[key].get<std::string>();
    }
    return "";
}

} // anonymous namespace

const ToolProperty* ToolInputSchema::Find(const std::string& name) const {
    auto it = std::find_if(properties.begin(), properties.end(),
        [&](const ToolProperty& p) { return p.name == name; });
    return it == properties.end() ? nullptr : &*it;
}

bool ToolInputSchema::IsRequired(const std::string& name) const {
    return std::find(required.begin(), required.end(), name) != required.end();
}

nlohmann::json ToolInputSchema::ToJson() const {
    nlohmann::json props = nlohmann::json::object();
    for (const auto& p : properties) {
        nlohmann::json prop = {
            {"type", p.type},
            {"description", p.description},
        };
        if (p.items_type.has_value()) {
            prop["items"] = {{"type", *p.items_type}};
        }
        props[p.name] = std::move(prop);
    }
    return {
        {"type", type},
        {"properties", std::move(props)},
        {"required", required},
    };
}

nlohmann::json ToolDescriptor::ToJson() const {
    return {
        {"name", name},
        {"title", title},
        {"description", description},
        {"inputSchema", input_schema.ToJson()},
    };
}

Result<ToolDescriptor, Error> ToolDescriptorFromDefinition(
    const nlohmann::json& definition) {
    using R = Result<ToolDescriptor, Error>;

    if (!definition.is_object()) {
        return R::Err(MakeDefinitionError("Tool definition must be an object"));
    }
    auto title = OptionalString(definition, "title");
    if (title.empty()) {
        return R::Err(MakeDefinitionError("Tool definition is missing 'title'"));
    }

    ToolDescriptor descriptor;
    descriptor.name = title;
    descriptor.title = title;
    descriptor.description = OptionalString(definition, "description");

    if (definition.contains("properties") && !definition["properties"].is_null()) {
        const auto& props = definition["properties"];
        if (!props.is_object()) {
            return R::Err(MakeDefinitionError(
                "'properties' of tool '" + title + "' must be an object"));
        }
        for (const auto& [prop_name, prop_def] : props.items()) {
            if (!prop_def.is_object()) {
                return R::Err(MakeDefinitionError(
                    "Property '" + prop_name + "' must be an object"));
            }
            auto type = OptionalString(prop_def, "type");
            if (type.empty()) {
                return R::Err(MakeDefinitionError(
                    "Property '" + prop_name + "' is missing 'type'"));
            }

            ToolProperty property;
            property.name = prop_name;
            property.type = std::move(type);
            property.description = OptionalString(prop_def, "description");
            auto items_type = OptionalString(prop_def, "itemsType");
            if (!items_type.empty()) {
                property.items_type = std::move(items_type);
            }

            descriptor.input_schema.properties.push_back(std::move(property));
            descriptor.input_schema.required.push_back(prop_name);
        }
    }

    return R::Ok(std::move(descriptor));
}

// ---------------------------------------------------------------------------
// ToolDescriptorBuilder
// ---------------------------------------------------------------------------
ToolDescriptorBuilder::ToolDescriptorBuilder(std::string name, std::string title,
                                             std::string description) {
    descriptor_.name = std::move(name);
    descriptor_.title = std::move(title);
    descriptor_.description = std::move(description);
}

ToolDescriptorBuilder& ToolDescriptorBuilder::Property(std::string name,
                                                       std::string type,
                                                       std::string description,
                                                       bool required) {
    if (required) {
        descriptor_.input_schema.required.push_back(name);
    }
    descriptor_.input_schema.properties.push_back(
        {std::move(name), std::move(type), std::move(description), std::nullopt});
    return *this;
}

ToolDescriptorBuilder& ToolDescriptorBuilder::ArrayProperty(
    std::string name, std::string items_type, std::string description,
    bool required) {
    if (required) {
        descriptor_.input_schema.required.push_back(name);
    }
    descriptor_.input_schema.properties.push_back(
        {std::move(name), "array", std::move(description), std::move(items_type)});
    return *this;
}

} // namespace mcp_relay

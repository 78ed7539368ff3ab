#include <mcp_relay/builtin/catalog.hpp>

#include <mcp_relay/builtin/file_tools.hpp>
#include <mcp_relay/builtin/glossary_tool.hpp>
#include <mcp_relay/builtin/project_resolver.hpp>
#include <mcp_relay/core/log.hpp>

namespace mcp_relay {

Result<BuiltinCatalog, Error> BuildBuiltinCatalog(const ToolsConfig& config) {
    using R = Result<BuiltinCatalog, Error>;

    BuiltinCatalog catalog;

    if (config.project_dir.has_value()) {
        auto resolver = ProjectResolver::Create(config.project_dir, config.project_filter);
        if (resolver.IsErr()) {
            return R::Err(resolver.Error());
        }
        auto shared = std::make_shared<const ProjectResolver>(std::move(resolver).Value());
        catalog.internal_tools.push_back(MakeCreateFileTool(shared));
        catalog.internal_tools.push_back(MakeReadFileTool(shared));
        catalog.internal_tools.push_back(MakeFindFilesTool(shared));
        LogInfo("builtin", "File tools enabled for " + *config.project_dir);
    }

    if (config.glossary_path.has_value()) {
        auto glossary = Glossary::Load(*config.glossary_path);
        if (glossary.IsErr()) {
            return R::Err(glossary.Error());
        }
        auto shared = std::make_shared<const Glossary>(std::move(glossary).Value());
        catalog.glossary_tool = MakeGlossaryTool(shared, config.glossary_description);
        LogInfo("builtin", "Glossary demo enabled");
    }

    return R::Ok(std::move(catalog));
}

} // namespace mcp_relay

#pragma once

#include <mcp_relay/builtin/project_resolver.hpp>
#include <mcp_relay/registry/tool_registry.hpp>

#include <memory>

namespace mcp_relay {

// Direct tools working on files below the project base directory. Each
// answers with one text item holding a JSON object:
//   {"status": "success" | "failed", "error": "...", ...}

// get_file_text_by_path(projectName, pathInProject, maxLinesCount?)
Tool MakeReadFileTool(std::shared_ptr<const ProjectResolver> resolver);

// create_new_file(projectName, pathInProject, text, overwrite?)
Tool MakeCreateFileTool(std::shared_ptr<const ProjectResolver> resolver);

// find_files_by_glob(projectName, globPattern, fileCountLimit?,
//                    subDirectoryRelativePath?)
Tool MakeFindFilesTool(std::shared_ptr<const ProjectResolver> resolver);

} // namespace mcp_relay

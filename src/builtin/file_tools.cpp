#include <mcp_relay/builtin/file_tools.hpp>

#include <mcp_relay/builtin/glob.hpp>
#include <mcp_relay/core/log.hpp>

#include <filesystem>
#include <fstream>
#include <limits>
#include <system_error>

namespace mcp_relay {

namespace fs = std::filesystem;

namespace {

ToolResult StatusResult(const nlohmann::json& status) {
    return TextResult(status.dump());
}

ToolResult Failed(const std::string& error) {
    return StatusResult({{"status", "failed"}, {"error", error}});
}

std::string StringArg(const nlohmann::json& args, const char* key) {
    auto it = args.find(key);
    if (it != args.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return "";
}

// Integers may arrive as numbers or numeric strings.
std::optional<long long> IntArg(const nlohmann::json& args, const char* key) {
    auto it = args.find(key);
    if (it == args.end() || it->is_null()) {
        return std::nullopt;
    }
    if (it->is_number_integer()) {
        return it->get<long long>();
    }
    if (it->is_number()) {
        return static_cast<long long>(it->get<double>());
    }
    if (it->is_string()) {
        try {
            return std::stoll(it->get<std::string>());
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

bool BoolArg(const nlohmann::json& args, const char* key) {
    auto it = args.find(key);
    if (it == args.end()) {
        return false;
    }
    if (it->is_boolean()) {
        return it->get<bool>();
    }
    if (it->is_string()) {
        return it->get<std::string>() == "true";
    }
    return false;
}

std::string Relative(const fs::path& path, const fs::path& base) {
    return path.lexically_relative(base).generic_string();
}

// -- get_file_text_by_path ---------------------------------------------------

ToolResult ReadFile(const ProjectResolver& resolver, const nlohmann::json& args) {
    auto project = resolver.ResolveProject(StringArg(args, "projectName"));
    if (project.IsErr()) {
        return Failed(project.Error().message);
    }
    const auto path_in_project = StringArg(args, "pathInProject");
    auto target = ProjectResolver::ResolveInside(project.Value(), path_in_project,
                                                 "pathInProject");
    if (target.IsErr()) {
        return Failed(target.Error().message);
    }
    const auto& file = target.Value();
    if (!fs::exists(file)) {
        return Failed("File does not exist: " + path_in_project);
    }
    if (fs::is_directory(file)) {
        return Failed("Path refers to a directory, not a file: " + path_in_project);
    }

    std::ifstream in(file, std::ios::binary);
    if (!in) {
        LogError("builtin", "Cannot open " + file.string());
        return Failed("Failed to read file: " + path_in_project);
    }

    auto max_lines = IntArg(args, "maxLinesCount").value_or(std::numeric_limits<long long>::max());
    std::string text;
    std::string line;
    long long lines_read = 0;
    while (lines_read < max_lines && std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (lines_read > 0) {
            text += '\n';
        }
        text += line;
        ++lines_read;
    }
    if (in.bad()) {
        return Failed("Failed to read file: " + path_in_project);
    }

    LogDebug("builtin", "Read " + std::to_string(lines_read) + " line(s) from " + file.string());
    return StatusResult({
        {"status", "success"},
        {"text", text},
        {"linesRead", lines_read},
        {"message", "Successfully read from file: " + path_in_project},
    });
}

// -- create_new_file ----------------------------------------------------------

ToolResult CreateFile(const ProjectResolver& resolver, const nlohmann::json& args) {
    const auto project_name = StringArg(args, "projectName");
    auto project = resolver.ResolveProject(project_name);
    if (project.IsErr()) {
        return Failed(project.Error().message);
    }
    const auto path_in_project = StringArg(args, "pathInProject");
    if (path_in_project.empty()) {
        return Failed("pathInProject is missing");
    }
    auto target = ProjectResolver::ResolveInside(project.Value(), path_in_project,
                                                 "pathInProject");
    if (target.IsErr()) {
        return Failed(target.Error().message);
    }
    const auto& file = target.Value();
    const auto relative = Relative(file, project.Value());

    if (fs::exists(file) && !BoolArg(args, "overwrite")) {
        return Failed("File already exists and overwrite is not allowed: " + relative);
    }

    std::error_code ec;
    fs::create_directories(file.parent_path(), ec);
    if (ec) {
        LogError("builtin", "Cannot create " + file.parent_path().string() + ": " + ec.message());
        return Failed("Failed to write file '" + relative + "'");
    }

    std::ofstream out(file, std::ios::binary | std::ios::trunc);
    out << StringArg(args, "text");
    out.close();
    if (!out) {
        LogError("builtin", "Cannot write " + file.string());
        return Failed("Failed to write file '" + relative + "'");
    }

    LogInfo("builtin", "Created file " + file.string());
    return StatusResult({
        {"status", "success"},
        {"message", "File written in project " + project_name + ": " + relative},
    });
}

// -- find_files_by_glob -------------------------------------------------------

ToolResult FindFiles(const ProjectResolver& resolver, const nlohmann::json& args) {
    const auto project_name = StringArg(args, "projectName");
    auto project = resolver.ResolveProject(project_name);
    if (project.IsErr()) {
        return Failed(project.Error().message);
    }
    const auto& project_dir = project.Value();

    auto glob_text = StringArg(args, "globPattern");
    if (glob_text.empty()) {
        glob_text = "**/*.*";
    }

    fs::path search_root = project_dir;
    const auto sub_dir = StringArg(args, "subDirectoryRelativePath");
    if (!sub_dir.empty()) {
        auto resolved = ProjectResolver::ResolveInside(project_dir, sub_dir,
                                                       "subDirectoryRelativePath");
        if (resolved.IsErr()) {
            return Failed("Subdirectory path resolves outside project directory, access denied");
        }
        if (!fs::exists(resolved.Value())) {
            return Failed("Subdirectory does not exist: " + sub_dir);
        }
        if (!fs::is_directory(resolved.Value())) {
            return Failed("Subdirectory path is not a directory: " + sub_dir);
        }
        search_root = resolved.Value();
    }

    const auto limit = IntArg(args, "fileCountLimit").value_or(std::numeric_limits<long long>::max());
    if (limit <= 0) {
        return StatusResult({
            {"status", "success"},
            {"files", nlohmann::json::array()},
            {"fileCount", 0},
            {"message", "No files returned due to zero or negative limit"},
        });
    }

    auto glob = GlobPattern::Compile(glob_text);
    if (glob.IsErr()) {
        return Failed("Failed to process glob pattern '" + glob_text + "' for '" +
                      project_name + "'");
    }

    nlohmann::json files = nlohmann::json::array();
    std::error_code ec;
    fs::recursive_directory_iterator it(search_root,
                                        fs::directory_options::skip_permission_denied, ec);
    for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (static_cast<long long>(files.size()) >= limit) {
            break;
        }
        if (!it->is_regular_file(ec)) {
            continue;
        }
        // Patterns are relative to the project, not the sub directory.
        const auto relative = Relative(it->path(), project_dir);
        if (!glob.Value().Matches(relative)) {
            continue;
        }
        std::error_code size_ec;
        auto size = fs::file_size(it->path(), size_ec);
        files.push_back({
            {"path", relative},
            {"size", size_ec ? -1 : static_cast<long long>(size)},
        });
    }
    if (ec) {
        LogError("builtin", "Walking " + search_root.string() + " failed: " + ec.message());
        return Failed("Failed to process glob pattern '" + glob_text + "' for '" +
                      project_name + "'");
    }

    const auto count = files.size();
    return StatusResult({
        {"status", "success"},
        {"files", std::move(files)},
        {"fileCount", count},
        {"message", "Found " + std::to_string(count) + " file(s) matching pattern"},
    });
}

} // anonymous namespace

Tool MakeReadFileTool(std::shared_ptr<const ProjectResolver> resolver) {
    auto descriptor = ToolDescriptorBuilder(
            "get_file_text_by_path", "Read File Text by Path",
            "Reads text content from a file in the specified project if access conditions are met.")
        .Property("projectName", "string", "Name of the project")
        .Property("pathInProject", "string", "Path of the file relative to the project directory")
        .Property("maxLinesCount", "integer",
                  "Optional maximum number of lines to read from the file", false)
        .Build();
    return MakeDirectTool(std::move(descriptor),
        [resolver = std::move(resolver)](const nlohmann::json& args) {
            return ReadFile(*resolver, args);
        });
}

Tool MakeCreateFileTool(std::shared_ptr<const ProjectResolver> resolver) {
    auto descriptor = ToolDescriptorBuilder(
            "create_new_file", "Create New File",
            "Creates a new file in the specified project and path if conditions are met.")
        .Property("projectName", "string", "Name of the project")
        .Property("pathInProject", "string", "Path of the file relative to the project directory")
        .Property("text", "string", "Content of the file (e.g. Java source code or HTML)")
        .Property("overwrite", "boolean", "Whether an existing file may be overwritten", false)
        .Build();
    return MakeDirectTool(std::move(descriptor),
        [resolver = std::move(resolver)](const nlohmann::json& args) {
            return CreateFile(*resolver, args);
        });
}

Tool MakeFindFilesTool(std::shared_ptr<const ProjectResolver> resolver) {
    auto descriptor = ToolDescriptorBuilder(
            "find_files_by_glob", "Find Files by Glob",
            "Finds files in the specified project matching the given glob pattern "
            "if access conditions are met.")
        .Property("projectName", "string", "Name of the project")
        .Property("globPattern", "string",
                  "Glob pattern for matching files relative to the project directory, e.g. **/*.java")
        .Property("fileCountLimit", "integer", "Optional maximum number of files to return", false)
        .Property("subDirectoryRelativePath", "string",
                  "Optional subdirectory path relative to the project root where the search "
                  "should be limited to, e.g. a source folder src/main/java", false)
        .Build();
    return MakeDirectTool(std::move(descriptor),
        [resolver = std::move(resolver)](const nlohmann::json& args) {
            return FindFiles(*resolver, args);
        });
}

} // namespace mcp_relay

#include <mcp_relay/builtin/project_resolver.hpp>

#include <mcp_relay/core/log.hpp>

#include <algorithm>
#include <iterator>
#include <system_error>

namespace mcp_relay {

namespace fs = std::filesystem;

namespace {

Error MakeAccessError(const std::string& message) {
    return Error::Make(ErrorCategory::Io, "ResolveProject", message);
}

} // anonymous namespace

Result<ProjectResolver, Error> ProjectResolver::Create(
    std::optional<std::string> base_dir, std::optional<std::string> filter) {
    ProjectResolver resolver;
    if (base_dir.has_value() && !base_dir->empty()) {
        std::error_code ec;
        auto absolute = fs::absolute(*base_dir, ec);
        resolver.base_dir_ = (ec ? fs::path(*base_dir) : absolute).lexically_normal();
    }
    if (filter.has_value() && !filter->empty()) {
        try {
            resolver.filter_ = std::regex(*filter);
        } catch (const std::regex_error& e) {
            return Result<ProjectResolver, Error>::Err(Error::Make(
                ErrorCategory::Config, "ProjectResolver",
                "Invalid regex in project filter: " + std::string(e.what())));
        }
    }
    return Result<ProjectResolver, Error>::Ok(std::move(resolver));
}

bool ProjectResolver::IsWithin(const fs::path& parent, const fs::path& child) {
    auto p = parent.lexically_normal();
    auto c = child.lexically_normal();
    // A trailing separator leaves an empty last element; ignore it.
    auto p_end = p.end();
    if (p_end != p.begin() && std::prev(p_end)->empty()) {
        --p_end;
    }
    auto it_c = c.begin();
    for (auto it_p = p.begin(); it_p != p_end; ++it_p, ++it_c) {
        if (it_c == c.end() || *it_p != *it_c) {
            return false;
        }
    }
    return true;
}

Result<fs::path, Error> ProjectResolver::ResolveProject(
    const std::string& project_name) const {
    using R = Result<fs::path, Error>;

    if (!base_dir_.has_value()) {
        return R::Err(MakeAccessError("Project directory is not configured"));
    }
    if (!fs::exists(*base_dir_)) {
        LogError("builtin", "Project base directory does not exist: " + base_dir_->string());
        return R::Err(MakeAccessError("Project base directory does not exist: " +
                                      base_dir_->string()));
    }
    if (project_name.empty()) {
        return R::Err(MakeAccessError("projectName is missing"));
    }
    if (filter_.has_value() && !std::regex_match(project_name, *filter_)) {
        LogWarn("builtin", "Access denied to project '" + project_name + "' due to filter");
        return R::Err(MakeAccessError("Project name '" + project_name +
                                      "' is not allowed by filter"));
    }

    auto project_dir = (*base_dir_ / project_name).lexically_normal();
    if (!IsWithin(*base_dir_, project_dir)) {
        LogWarn("builtin", "Directory traversal in project name: " + project_name);
        return R::Err(MakeAccessError(
            "Project directory is outside base directory, access denied"));
    }
    if (!fs::is_directory(project_dir)) {
        return R::Err(MakeAccessError("Project directory does not exist: " + project_name));
    }
    return R::Ok(std::move(project_dir));
}

Result<fs::path, Error> ProjectResolver::ResolveInside(const fs::path& parent,
                                                       const std::string& relative,
                                                       const std::string& what) {
    using R = Result<fs::path, Error>;

    auto target = (parent / relative).lexically_normal();
    if (fs::path(relative).is_absolute() || !IsWithin(parent, target)) {
        LogWarn("builtin", "Path traversal attempt in " + what + ": " + relative);
        return R::Err(MakeAccessError("Path traversal detected in " + what + ": " + relative));
    }
    return R::Ok(std::move(target));
}

} // namespace mcp_relay

#pragma once

#include <mcp_relay/core/result.hpp>

#include <filesystem>
#include <optional>
#include <regex>
#include <string>

namespace mcp_relay {

// ---------------------------------------------------------------------------
// ProjectResolver — maps a project name and a relative path to a location
// below the configured project base directory.
//
// Every resolution is lexically normalized and must stay inside its parent;
// project names must fully match the optional filter.
// ---------------------------------------------------------------------------
class ProjectResolver {
public:
    // Fails with Config when `filter` is not a valid regex.
    static Result<ProjectResolver, Error> Create(std::optional<std::string> base_dir,
                                                 std::optional<std::string> filter);

    [[nodiscard]] bool IsConfigured() const noexcept { return base_dir_.has_value(); }

    // Existing project directory for `project_name`.
    [[nodiscard]] Result<std::filesystem::path, Error> ResolveProject(
        const std::string& project_name) const;

    // `relative` below `parent`; fails on traversal. Existence is not checked.
    [[nodiscard]] static Result<std::filesystem::path, Error> ResolveInside(
        const std::filesystem::path& parent, const std::string& relative,
        const std::string& what);

    // True when `child` equals `parent` or lies below it (both normalized).
    [[nodiscard]] static bool IsWithin(const std::filesystem::path& parent,
                                       const std::filesystem::path& child);

private:
    ProjectResolver() = default;

    std::optional<std::filesystem::path> base_dir_;
    std::optional<std::regex> filter_;
};

} // namespace mcp_relay

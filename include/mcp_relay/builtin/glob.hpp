#pragma once

#include <mcp_relay/core/result.hpp>

#include <regex>
#include <string>

namespace mcp_relay {

// ---------------------------------------------------------------------------
// GlobPattern — path glob matched against '/'-separated relative paths.
//
//   *      any run of characters within one path segment
//   **     any run of characters across segments ("**/" may match nothing)
//   ?      one character other than '/'
//   [...]  character class, "[!...]" negated
//   {a,b}  alternatives
// ---------------------------------------------------------------------------
class GlobPattern {
public:
    static Result<GlobPattern, Error> Compile(const std::string& pattern);

    [[nodiscard]] bool Matches(const std::string& relative_path) const;
    [[nodiscard]] const std::string& Pattern() const noexcept { return pattern_; }

private:
    GlobPattern(std::string pattern, std::regex regex)
        : pattern_(std::move(pattern)), regex_(std::move(regex)) {}

    std::string pattern_;
    std::regex regex_;
};

// Translate a glob to an ECMAScript regex source. Fails on unterminated
// classes or groups.
Result<std::string, Error> GlobToRegex(const std::string& pattern);

} // namespace mcp_relay

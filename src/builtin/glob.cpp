#include <mcp_relay/builtin/glob.hpp>

#include <cstring>

namespace mcp_relay {

namespace {

Error MakeGlobError(const std::string& pattern, const std::string& message) {
    auto error = Error::Make(ErrorCategory::MalformedMessage, "GlobPattern", message);
    error.detail = pattern;
    return error;
}

bool IsRegexSpecial(char c) {
    return std::strchr("\\^$.|+()[]{}*?", c) != nullptr;
}

} // anonymous namespace

Result<std::string, Error> GlobToRegex(const std::string& pattern) {
    using R = Result<std::string, Error>;

    std::string out = "^";
    bool in_group = false;
    for (size_t i = 0; i < pattern.size(); ++i) {
        const char c = pattern[i];
        switch (c) {
            case '*':
                if (i + 1 < pattern.size() && pattern[i + 1] == '*') {
                    ++i;
                    if (i + 1 < pattern.size() && pattern[i + 1] == '/') {
                        ++i;
                        out += "(?:.*/)?";
                    } else {
                        out += ".*";
                    }
                } else {
                    out += "[^/]*";
                }
                break;
            case '?':
                out += "[^/]";
                break;
            case '[': {
                auto close = pattern.find(']', i + 1);
                if (close == std::string::npos) {
                    return R::Err(MakeGlobError(pattern, "Unterminated character class"));
                }
                out += '[';
                size_t j = i + 1;
                if (j < close && (pattern[j] == '!' || pattern[j] == '^')) {
                    out += '^';
                    ++j;
                }
                for (; j < close; ++j) {
                    if (pattern[j] == '\\' || pattern[j] == '[' || pattern[j] == ']') {
                        out += '\\';
                    }
                    out += pattern[j];
                }
                out += ']';
                i = close;
                break;
            }
            case '{':
                if (in_group) {
                    return R::Err(MakeGlobError(pattern, "Nested groups are not supported"));
                }
                in_group = true;
                out += "(?:";
                break;
            case '}':
                if (!in_group) {
                    out += "\\}";
                } else {
                    in_group = false;
                    out += ')';
                }
                break;
            case ',':
                out += in_group ? "|" : ",";
                break;
            case '\\':
                if (i + 1 < pattern.size()) {
                    ++i;
                    if (IsRegexSpecial(pattern[i])) {
                        out += '\\';
                    }
                    out += pattern[i];
                } else {
                    out += "\\\\";
                }
                break;
            default:
                if (IsRegexSpecial(c)) {
                    out += '\\';
                }
                out += c;
                break;
        }
    }
    if (in_group) {
        return R::Err(MakeGlobError(pattern, "Unterminated group"));
    }
    out += '$';
    return R::Ok(std::move(out));
}

Result<GlobPattern, Error> GlobPattern::Compile(const std::string& pattern) {
    auto source = GlobToRegex(pattern);
    if (source.IsErr()) {
        return Result<GlobPattern, Error>::Err(source.Error());
    }
    try {
        return Result<GlobPattern, Error>::Ok(
            GlobPattern(pattern, std::regex(source.Value())));
    } catch (const std::regex_error& e) {
        return Result<GlobPattern, Error>::Err(
            MakeGlobError(pattern, std::string("Invalid glob: ") + e.what()));
    }
}

bool GlobPattern::Matches(const std::string& relative_path) const {
    return std::regex_match(relative_path, regex_);
}

} // namespace mcp_relay

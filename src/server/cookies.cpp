#include <mcp_relay/server/cookies.hpp>

#include <mcp_relay/core/log.hpp>
#include <mcp_relay/core/url.hpp>

#include <regex>

namespace mcp_relay {

namespace {

std::string EscapeRegex(const std::string& s) {
    static const std::regex special(R"([.^$|()\[\]{}*+?\\])");
    return std::regex_replace(s, special, R"(\$&)");
}

} // anonymous namespace

Result<std::string, Error> ExtractSessionId(const std::optional<std::string>& cookie_header,
                                            const std::string& cookie_name) {
    using R = Result<std::string, Error>;

    if (!cookie_header.has_value()) {
        return R::Err(Error::Make(ErrorCategory::UnknownSession, "SessionCookie",
                                  "Missing cookie in request"));
    }

    const std::regex pattern("(?:.*; *)?" + EscapeRegex(cookie_name) + "=([^; ]+).*");
    std::smatch match;
    if (!std::regex_match(*cookie_header, match, pattern)) {
        LogInfo("http", "Cookie: " + *cookie_header);
        return R::Err(Error::Make(ErrorCategory::UnknownSession, "SessionCookie",
                                  "Missing user-cookie in request"));
    }
    return R::Ok(UrlDecode(match[1].str()));
}

std::string MakeSessionCookie(const std::string& cookie_name, const std::string& session_id) {
    return cookie_name + "=" + UrlEncode(session_id);
}

} // namespace mcp_relay

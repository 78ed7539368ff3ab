#include <mcp_relay/core/url.hpp>

#include <cctype>
#include <iomanip>
#include <sstream>

namespace mcp_relay {

namespace {

Error MakeUrlError(const std::string& url, const std::string& message) {
    auto error = Error::Make(ErrorCategory::Config, "ParseUrl", message);
    error.endpoint = url;
    return error;
}

int HexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

std::string HttpUrl::Origin() const {
    return scheme + "://" + host + ":" + std::to_string(port);
}

Result<HttpUrl, Error> ParseHttpUrl(const std::string& url) {
    using R = Result<HttpUrl, Error>;

    HttpUrl out;
    std::string rest;
    if (url.rfind("http://", 0) == 0) {
        out.scheme = "http";
        out.port = 80;
        rest = url.substr(7);
    } else if (url.rfind("https://", 0) == 0) {
        out.scheme = "https";
        out.port = 443;
        rest = url.substr(8);
    } else {
        return R::Err(MakeUrlError(url, "URL must start with http:// or https://"));
    }

    auto slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    if (slash != std::string::npos) {
        out.path = rest.substr(slash);
    }
    if (authority.empty()) {
        return R::Err(MakeUrlError(url, "URL has no host"));
    }

    // [v6]:port, host:port or host
    std::string port_text;
    if (authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string::npos) {
            return R::Err(MakeUrlError(url, "Unterminated IPv6 address"));
        }
        out.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') {
                return R::Err(MakeUrlError(url, "Invalid authority"));
            }
            port_text = authority.substr(close + 2);
        }
    } else {
        auto colon = authority.rfind(':');
        out.host = authority.substr(0, colon);
        if (colon != std::string::npos) {
            port_text = authority.substr(colon + 1);
        }
    }
    if (out.host.empty()) {
        return R::Err(MakeUrlError(url, "URL has no host"));
    }

    if (!port_text.empty()) {
        int port = 0;
        for (char c : port_text) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                return R::Err(MakeUrlError(url, "Invalid port: " + port_text));
            }
            port = port * 10 + (c - '0');
            if (port > 65535) {
                return R::Err(MakeUrlError(url, "Port out of range: " + port_text));
            }
        }
        if (port == 0) {
            return R::Err(MakeUrlError(url, "Port out of range: " + port_text));
        }
        out.port = static_cast<uint16_t>(port);
    }

    return R::Ok(std::move(out));
}

std::string JoinPath(const std::string& base, const std::string& path) {
    if (base.empty()) return path;
    if (path.empty()) return base;
    const bool base_slash = base.back() == '/';
    const bool path_slash = path.front() == '/';
    if (base_slash && path_slash) return base + path.substr(1);
    if (!base_slash && !path_slash) return base + "/" + path;
    return base + path;
}

std::string UrlEncode(const std::string& value) {
    std::ostringstream encoded;
    encoded.fill('0');
    encoded << std::hex << std::uppercase;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded << c;
        } else {
            encoded << '%' << std::setw(2) << static_cast<int>(c);
        }
    }
    return encoded.str();
}

std::string UrlDecode(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        if (value[i] == '%' && i + 2 < value.size()) {
            int hi = HexValue(value[i + 1]);
            int lo = HexValue(value[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>(hi * 16 + lo));
                i += 2;
                continue;
            }
        }
        out.push_back(value[i]);
    }
    return out;
}

} // namespace mcp_relay

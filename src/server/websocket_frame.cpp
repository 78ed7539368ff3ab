#include <mcp_relay/server/websocket_frame.hpp>

#include <openssl/evp.h>
#include <openssl/sha.h>

#include <algorithm>
#include <cctype>
#include <sstream>
#include <vector>

namespace mcp_relay {

namespace {

constexpr std::string_view kWebSocketGuid = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

Error Malformed(const std::string& message) {
    return Error::Make(ErrorCategory::MalformedMessage, "WsFrame", message);
}

std::string Trim(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return std::string(s.substr(b, e - b));
}

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool IsKnownOpcode(uint8_t op) {
    return op == 0x0 || op == 0x1 || op == 0x2 || op == 0x8 || op == 0x9 || op == 0xA;
}

} // anonymous namespace

Result<WsFrame, Error> ReadFrame(const ByteReader& read) {
    using R = Result<WsFrame, Error>;

    std::array<uint8_t, 2> header{};
    if (!read(header.data(), header.size())) {
        return R::Err(Error::Make(ErrorCategory::ConnectionClosed, "WsFrame",
                                  "Connection closed by peer"));
    }

    const bool fin = (header[0] & 0x80u) != 0;
    const uint8_t op = static_cast<uint8_t>(header[0] & 0x0Fu);
    const bool masked = (header[1] & 0x80u) != 0;
    uint64_t payload_len = header[1] & 0x7Fu;

    if (!IsKnownOpcode(op)) {
        return R::Err(Malformed("Unknown opcode " + std::to_string(op)));
    }
    if (!fin || op == 0x0) {
        return R::Err(Malformed("Fragmented frames are not supported"));
    }

    if (payload_len == 126u) {
        std::array<uint8_t, 2> ext{};
        if (!read(ext.data(), ext.size())) {
            return R::Err(Malformed("Truncated frame length"));
        }
        payload_len = (static_cast<uint64_t>(ext[0]) << 8u) | ext[1];
    } else if (payload_len == 127u) {
        std::array<uint8_t, 8> ext{};
        if (!read(ext.data(), ext.size())) {
            return R::Err(Malformed("Truncated frame length"));
        }
        payload_len = 0;
        for (auto byte : ext) {
            payload_len = (payload_len << 8u) | byte;
        }
    }

    if (!masked) {
        return R::Err(Malformed("Client frame is not masked"));
    }
    if (payload_len > kMaxWsPayloadBytes) {
        return R::Err(Malformed("Frame payload too large: " + std::to_string(payload_len)));
    }

    std::array<uint8_t, 4> mask{};
    if (!read(mask.data(), mask.size())) {
        return R::Err(Malformed("Truncated frame mask"));
    }

    std::vector<uint8_t> bytes(static_cast<size_t>(payload_len));
    if (!bytes.empty() && !read(bytes.data(), bytes.size())) {
        return R::Err(Malformed("Truncated frame payload"));
    }
    for (size_t i = 0; i < bytes.size(); ++i) {
        bytes[i] ^= mask[i % mask.size()];
    }

    WsFrame frame;
    frame.opcode = static_cast<WsOpcode>(op);
    frame.payload.assign(reinterpret_cast<const char*>(bytes.data()), bytes.size());
    return R::Ok(std::move(frame));
}

std::string EncodeFrame(WsOpcode opcode, std::string_view payload,
                        std::optional<std::array<uint8_t, 4>> mask) {
    std::string frame;
    frame.reserve(payload.size() + 14);
    frame.push_back(static_cast<char>(0x80u | (static_cast<uint8_t>(opcode) & 0x0Fu)));

    const uint8_t mask_bit = mask.has_value() ? 0x80u : 0x00u;
    const auto size = payload.size();
    if (size <= 125u) {
        frame.push_back(static_cast<char>(mask_bit | size));
    } else if (size <= 65535u) {
        frame.push_back(static_cast<char>(mask_bit | 126u));
        frame.push_back(static_cast<char>((size >> 8u) & 0xFFu));
        frame.push_back(static_cast<char>(size & 0xFFu));
    } else {
        frame.push_back(static_cast<char>(mask_bit | 127u));
        for (int shift = 56; shift >= 0; shift -= 8) {
            frame.push_back(static_cast<char>((static_cast<uint64_t>(size) >> shift) & 0xFFu));
        }
    }

    if (!mask.has_value()) {
        frame.append(payload.data(), payload.size());
        return frame;
    }
    for (auto b : *mask) {
        frame.push_back(static_cast<char>(b));
    }
    for (size_t i = 0; i < payload.size(); ++i) {
        frame.push_back(static_cast<char>(static_cast<uint8_t>(payload[i]) ^ (*mask)[i % 4]));
    }
    return frame;
}

std::string ComputeAcceptKey(const std::string& client_key) {
    const std::string source = client_key + std::string(kWebSocketGuid);
    std::array<unsigned char, SHA_DIGEST_LENGTH> digest{};
    SHA1(reinterpret_cast<const unsigned char*>(source.data()), source.size(), digest.data());

    const int output_len = 4 * static_cast<int>((digest.size() + 2) / 3);
    std::string output(static_cast<size_t>(output_len) + 1, '\0');
    EVP_EncodeBlock(reinterpret_cast<unsigned char*>(output.data()), digest.data(),
                    static_cast<int>(digest.size()));
    output.resize(static_cast<size_t>(output_len));
    return output;
}

std::string WsHandshakeRequest::Header(const std::string& lower_name) const {
    auto it = headers.find(lower_name);
    return it == headers.end() ? std::string() : it->second;
}

Result<WsHandshakeRequest, Error> ParseHandshakeRequest(std::string_view request) {
    using R = Result<WsHandshakeRequest, Error>;

    const auto end = request.find("\r\n\r\n");
    if (end == std::string_view::npos) {
        return R::Err(Malformed("Incomplete handshake request"));
    }

    WsHandshakeRequest out;
    std::istringstream lines(std::string(request.substr(0, end)));
    std::string line;
    bool first = true;
    while (std::getline(lines, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (first) {
            first = false;
            std::istringstream parts(line);
            std::string target;
            parts >> out.method >> target;
            out.path = target.substr(0, target.find('?'));
            continue;
        }
        const auto colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        out.headers[ToLower(Trim(line.substr(0, colon)))] = Trim(line.substr(colon + 1));
    }

    if (out.method != "GET") {
        return R::Err(Malformed("WebSocket handshake requires GET"));
    }
    if (ToLower(out.Header("upgrade")) != "websocket" ||
        ToLower(out.Header("connection")).find("upgrade") == std::string::npos ||
        out.Header("sec-websocket-version") != "13" ||
        out.Header("sec-websocket-key").empty()) {
        return R::Err(Malformed("Missing WebSocket upgrade headers"));
    }
    return R::Ok(std::move(out));
}

std::string BuildHandshakeResponse(const std::string& client_key) {
    std::ostringstream response;
    response << "HTTP/1.1 101 Switching Protocols\r\n"
             << "Upgrade: websocket\r\n"
             << "Connection: Upgrade\r\n"
             << "Sec-WebSocket-Accept: " << ComputeAcceptKey(client_key) << "\r\n"
             << "\r\n";
    return response.str();
}

std::string BuildHttpError(int status, const std::string& reason, const std::string& body) {
    std::ostringstream response;
    response << "HTTP/1.1 " << status << " " << reason << "\r\n"
             << "Content-Type: text/plain\r\n"
             << "Content-Length: " << body.size() << "\r\n"
             << "Connection: close\r\n"
             << "\r\n"
             << body;
    return response.str();
}

} // namespace mcp_relay

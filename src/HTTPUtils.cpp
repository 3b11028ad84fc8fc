#include "HTTPUtils.hpp"
#include "StringUtils.hpp"

using namespace utils;

namespace http_utils {

std::string_view statusText(int status_code) {
    switch (status_code) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 500: return "Internal Server Error";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
        default:  return "";
    }
}

bool splitHostPort(std::string_view authority, std::string& host, int& port) {
    std::string_view host_part;
    std::string_view port_part;

    if (!authority.empty() && authority.front() == '[') {
        // [v6]:port
        size_t close = authority.find(']');
        if (close == std::string_view::npos || close + 1 >= authority.size() ||
            authority[close + 1] != ':') {
            return false;
        }
        host_part = authority.substr(1, close - 1);
        port_part = authority.substr(close + 2);
    } else {
        size_t colon = authority.rfind(':');
        if (colon == std::string_view::npos) {
            return false;
        }
        host_part = authority.substr(0, colon);
        port_part = authority.substr(colon + 1);
        if (host_part.find(':') != std::string_view::npos) {
            return false;  // bare IPv6 without brackets
        }
    }

    unsigned int value = 0;
    if (host_part.empty() || !parseNumber(port_part, value) || value == 0 || value > 65535) {
        return false;
    }

    host = std::string{host_part};
    port = static_cast<int>(value);
    return true;
}

std::string sanitizeForLog(std::string_view line) {
    // Trim at first CRLF
    if (auto p = line.find("\r\n"); p != std::string_view::npos) {
        line = line.substr(0, p);
    }

    // Keep only printable ASCII and tab
    std::string out;
    out.reserve(line.size());
    for (unsigned char c : line) {
        if ((c >= 32 && c <= 126) || c == '\t') {
            out.push_back(static_cast<char>(c));
        }
    }

    // Redact credentials if present
    for (const char* key : {"authorization: basic", "proxy-authorization: basic"}) {
        auto pos = toLower(out).find(key);
        if (pos != std::string::npos) {
            auto val_start = pos + std::string_view(key).size();
            while (val_start < out.size() && (out[val_start] == ' ' || out[val_start] == '\t')) {
                ++val_start;
            }
            out.replace(val_start, out.size() - val_start, "[REDACTED]");
        }
    }

    // Cap length
    constexpr size_t kMax = 512;
    if (out.size() > kMax) {
        out.resize(kMax);
        out += "...";
    }
    return out;
}

} // namespace http_utils

#include "HTTPRequestParser.hpp"
#include "HTTPUtils.hpp"
#include <sys/socket.h>
#include <algorithm>
#include <cerrno>
#include "StringUtils.hpp"

using namespace utils;

// ============================================================================
// Public Methods
// ============================================================================

bool HTTPRequestParser::readRequest(int client_fd, HTTPRequest& out, std::string& leftover, std::string& error) {
    std::string head;
    if (!readHead(client_fd, head, leftover)) {
        if (head.size() >= kMaxHeadSize) {
            error = "Request head too large";
        }
        return false;
    }

    if (!parse(head, out, error)) {
        return false;
    }

    // Check if request has a body (Content-Length header)
    size_t content_length = 0;
    std::string length_value = out.headers.get("Content-Length");
    if (!length_value.empty() && !parseNumber(trim(length_value), content_length)) {
        error = "Invalid Content-Length";
        return false;
    }
    if (content_length > kMaxBodySize) {
        error = "Request body too large";
        return false;
    }

    if (content_length == 0) {
        // No body (typical for CONNECT)
        return true;
    }

    // Part of the body may have arrived with the head
    std::string body = leftover.substr(0, std::min(content_length, leftover.size()));
    leftover.erase(0, body.size());

    if (body.size() < content_length) {
        size_t remaining = content_length - body.size();
        std::string rest = readExact(client_fd, remaining);
        if (rest.size() != remaining) {
            error = "Incomplete request body";
            return false;
        }
        body += rest;
    }

    out.body = std::make_unique<BufferedBody>(std::move(body));
    return true;
}

bool HTTPRequestParser::parse(std::string_view head, HTTPRequest& out, std::string& error) {
    size_t line_end = head.find("\r\n");
    std::string_view request_line = head.substr(0, line_end);

    // Request line: METHOD SP target SP version
    size_t first_space = request_line.find(' ');
    size_t last_space = request_line.rfind(' ');
    if (first_space == std::string_view::npos || first_space == last_space) {
        error = "Malformed request line";
        return false;
    }

    out.method = std::string{request_line.substr(0, first_space)};
    out.target = std::string{trim(request_line.substr(first_space + 1, last_space - first_space - 1))};
    out.version = std::string{request_line.substr(last_space + 1)};

    if (out.method.empty() || out.target.empty() || out.version.rfind("HTTP/1.", 0) != 0) {
        error = "Malformed request line";
        return false;
    }

    // Header fields
    size_t pos = (line_end == std::string_view::npos) ? head.size() : line_end + 2;
    while (pos < head.size()) {
        size_t end = head.find("\r\n", pos);
        if (end == std::string_view::npos) {
            end = head.size();
        }
        std::string_view line = head.substr(pos, end - pos);
        pos = end + 2;

        if (line.empty()) {
            break;  // blank line ends the head
        }

        size_t colon = line.find(':');
        if (colon == std::string_view::npos || colon == 0) {
            error = "Malformed header field";
            return false;
        }
        out.headers.add(trim(line.substr(0, colon)), trim(line.substr(colon + 1)));
    }

    // CONNECT example.com:443 HTTP/1.1 -- the destination comes from the
    // request-target only, never from the Host header
    if (out.isConnect()) {
        std::string host;
        int port = 0;
        if (!http_utils::splitHostPort(out.target, host, port)) {
            error = "Invalid CONNECT target";
            return false;
        }
        out.authority = out.target;
    }

    return true;
}

// ============================================================================
// Private Helper Methods
// ============================================================================

bool HTTPRequestParser::readHead(int client_fd, std::string& head, std::string& leftover) {
    head.clear();
    leftover.clear();
    char buf[8192];

    while (head.size() < kMaxHeadSize) {
        ssize_t n = recv(client_fd, buf, sizeof(buf), 0);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            return false;  // Connection closed or error
        }

        size_t search_from = head.size() >= 3 ? head.size() - 3 : 0;
        head.append(buf, static_cast<size_t>(n));

        // Check if we have the complete head
        size_t end = head.find("\r\n\r\n", search_from);
        if (end != std::string::npos) {
            leftover = head.substr(end + 4);
            head.erase(end + 4);
            return true;
        }
    }
    return false;
}

std::string HTTPRequestParser::readExact(int fd, size_t n) {
    std::string result;
    result.reserve(n);

    char buf[8192];
    size_t total = 0;

    while (total < n) {
        size_t to_read = std::min(sizeof(buf), n - total);
        ssize_t bytes = recv(fd, buf, to_read, 0);

        if (bytes < 0 && errno == EINTR) {
            continue;
        }
        if (bytes <= 0) {
            return result;  // Partial read or error
        }

        result.append(buf, static_cast<size_t>(bytes));
        total += static_cast<size_t>(bytes);
    }

    return result;
}

#pragma once
#include <string>
#include <string_view>

namespace http_utils {

constexpr int StatusOK = 200;
constexpr int StatusBadRequest = 400;
constexpr int StatusMethodNotAllowed = 405;
constexpr int StatusBadGateway = 502;

/**
 * Reason phrase for a status code
 *
 * @return e.g. "Bad Gateway" for 502, or empty string if unknown
 */
std::string_view statusText(int status_code);

/**
 * Split an authority of the form host:port or [v6-host]:port
 *
 * Brackets are stripped from IPv6 hosts. The port must be present and
 * numeric in 1..65535.
 *
 * @param authority Authority string (e.g. "example.com:443")
 * @param host Output host
 * @param port Output port
 * @return true if authority was well formed
 */
bool splitHostPort(std::string_view authority, std::string& host, int& port);

/**
 * Make a request or status line safe to log
 *
 * Trims at the first CRLF, keeps printable ASCII and tabs, redacts
 * Basic credentials and caps the length.
 */
std::string sanitizeForLog(std::string_view line);

} // namespace http_utils

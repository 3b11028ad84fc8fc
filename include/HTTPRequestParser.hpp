#ifndef HTTP_REQUEST_PARSER_HPP
#define HTTP_REQUEST_PARSER_HPP

#include "HTTPRequest.hpp"

#include <string>
#include <string_view>

/**
 * HTTPRequestParser - Handles reading and parsing HTTP requests from client sockets
 *
 * Responsibilities:
 * - Read a complete request head (and body if Content-Length says so)
 * - Parse the request line and header fields
 * - Extract the CONNECT authority from the request-target
 */
class HTTPRequestParser {
public:
    /** Request heads larger than this are rejected */
    static constexpr size_t kMaxHeadSize = 64 * 1024;

    /** Bodies larger than this are rejected */
    static constexpr size_t kMaxBodySize = 1024 * 1024;

    /**
     * Read and parse one request from the client socket
     *
     * Bytes received after the end of the request (e.g. a TLS ClientHello
     * pipelined after CONNECT) are returned in `leftover`.
     *
     * @param client_fd Socket file descriptor
     * @param out Parsed request
     * @param leftover Bytes read past the end of the request
     * @param error Reason for failure, empty if the client simply disconnected
     * @return true on success
     */
    static bool readRequest(int client_fd, HTTPRequest& out, std::string& leftover, std::string& error);

    /**
     * Parse a request head (request line + header fields, with or without the
     * terminating blank line)
     *
     * For CONNECT requests the target must be an authority (host:port or
     * [v6]:port); it is copied to `out.authority`.
     *
     * @param head Raw head
     * @param out Parsed request (body left empty)
     * @param error Reason for rejection
     * @return true if the head is well formed
     */
    static bool parse(std::string_view head, HTTPRequest& out, std::string& error);

private:
    /**
     * Helper: Read until we have a complete head (ending with \r\n\r\n)
     *
     * @param client_fd Socket file descriptor
     * @param head Output: head including the blank line
     * @param leftover Output: bytes received after the head
     * @return true on success, false on connection error or oversize head
     */
    static bool readHead(int client_fd, std::string& head, std::string& leftover);

    /**
     * Helper: Read exactly n bytes from socket
     *
     * @param fd Socket file descriptor
     * @param n Number of bytes to read
     * @return Data read, or shorter string if connection closed
     */
    static std::string readExact(int fd, size_t n);
};

#endif // HTTP_REQUEST_PARSER_HPP

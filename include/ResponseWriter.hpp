#ifndef RESPONSE_WRITER_HPP
#define RESPONSE_WRITER_HPP

#include "Connection.hpp"
#include "HTTPHeaders.hpp"
#include "HTTPRequest.hpp"
#include "Logger.hpp"
#include "TunnelError.hpp"

#include <chrono>
#include <optional>
#include <string>

/**
 * ResponseWriter - Writes the answer to a CONNECT straight onto a hijacked connection
 *
 * The connection has left the HTTP server by the time these run, so the
 * response is serialized by hand. Every respond call closes the request
 * body afterwards, whatever the outcome of the write.
 */
class ResponseWriter {
public:
    /** Keep-Alive timeout advertised is this much below the real idle timeout */
    static constexpr std::chrono::seconds kKeepAliveMargin{2};

    /**
     * Tell the client when idle connections get closed
     *
     * Sets "Keep-Alive: timeout=N" with N = idle timeout in seconds minus
     * kKeepAliveMargin, at least 1. Does nothing for a zero timeout.
     */
    static void addIdleKeepAlive(HTTPHeaders& headers, std::chrono::milliseconds idle_timeout);

    /**
     * Write 200 OK, after adding the keep-alive hint to `headers`
     */
    static TunnelError respondOK(Connection& conn,
                                 HTTPRequest& req,
                                 HTTPHeaders& headers,
                                 std::chrono::milliseconds idle_timeout,
                                 Logger& logger);

    /**
     * Write 502 Bad Gateway whose body is the redacted text of `cause`
     */
    static TunnelError respondBadGateway(Connection& conn,
                                         HTTPRequest& req,
                                         const HTTPHeaders& headers,
                                         const TunnelError& cause,
                                         Logger& logger);

    /**
     * Serialize and write a response, then close the request body
     *
     * @param body Absent for a body-less response (no Content-Length is sent)
     */
    static TunnelError respond(Connection& conn,
                               HTTPRequest& req,
                               int status_code,
                               const HTTPHeaders& headers,
                               const std::optional<std::string>& body,
                               Logger& logger);

    /** Status line, header fields, blank line and body */
    static std::string buildResponse(int status_code,
                                     const HTTPHeaders& headers,
                                     const std::optional<std::string>& body);

private:
    ResponseWriter() = delete;
};

#endif // RESPONSE_WRITER_HPP

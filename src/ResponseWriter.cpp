#include "ResponseWriter.hpp"
#include "HTTPUtils.hpp"

#include <algorithm>

#include <fmt/format.h>

// ====================================================================================================
// Public Methods
// ====================================================================================================

void ResponseWriter::addIdleKeepAlive(HTTPHeaders& headers, std::chrono::milliseconds idle_timeout) {
    if (idle_timeout.count() <= 0) {
        return;
    }
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(idle_timeout) - kKeepAliveMargin;
    headers.set("Keep-Alive", fmt::format("timeout={}", std::max<long long>(seconds.count(), 1)));
}

TunnelError ResponseWriter::respondOK(Connection& conn,
                                      HTTPRequest& req,
                                      HTTPHeaders& headers,
                                      std::chrono::milliseconds idle_timeout,
                                      Logger& logger) {
    addIdleKeepAlive(headers, idle_timeout);
    TunnelError err = respond(conn, req, http_utils::StatusOK, headers, std::nullopt, logger);
    if (err) {
        TunnelError full = err.wrap("Unable to respond OK: ");
        logger.error("{}", full.logMessage());
        return full;
    }
    return {};
}

TunnelError ResponseWriter::respondBadGateway(Connection& conn,
                                              HTTPRequest& req,
                                              const HTTPHeaders& headers,
                                              const TunnelError& cause,
                                              Logger& logger) {
    logger.debug("Responding BadGateway: {}", cause.logMessage());

    HTTPHeaders response_headers = headers;
    response_headers.set("Connection", "close");
    return respond(conn, req, http_utils::StatusBadGateway, response_headers, cause.publicMessage(), logger);
}

TunnelError ResponseWriter::respond(Connection& conn,
                                    HTTPRequest& req,
                                    int status_code,
                                    const HTTPHeaders& headers,
                                    const std::optional<std::string>& body,
                                    Logger& logger) {
    std::string response = buildResponse(status_code, headers, body);

    std::error_code ec;
    conn.write(response.data(), response.size(), ec);

    // The body is closed no matter how the write went
    if (req.body && !req.body->closed()) {
        if (std::error_code close_ec = req.body->close()) {
            logger.debug("Error closing body of request: {}", close_ec.message());
        }
    }

    if (ec) {
        return TunnelError(ec, ec.message());
    }
    return {};
}

std::string ResponseWriter::buildResponse(int status_code,
                                          const HTTPHeaders& headers,
                                          const std::optional<std::string>& body) {
    HTTPHeaders fields = headers;
    if (body) {
        if (!fields.has("Content-Type")) {
            fields.set("Content-Type", "text/plain; charset=utf-8");
        }
        fields.set("Content-Length", std::to_string(body->size()));
    } else {
        // A 2xx answer to CONNECT carries no Content-Length
        fields.remove("Content-Length");
    }

    std::string response = fmt::format("HTTP/1.1 {} {}\r\n", status_code, http_utils::statusText(status_code));
    response += fields.serialize();
    response += "\r\n";
    if (body) {
        response += *body;
    }
    return response;
}

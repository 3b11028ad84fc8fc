#include "ConnectProxyServer.hpp"
#include "HTTPRequestParser.hpp"
#include "HTTPUtils.hpp"
#include "ResponseSink.hpp"

#include <unistd.h>
#include <utility>

#include <fmt/format.h>

// ====================================================================================================
// Constructor
// ====================================================================================================
ConnectProxyServer::ConnectProxyServer(int port, ConnectConfig config, std::chrono::milliseconds dial_timeout)
    : BaseServer(port), interceptor(std::move(config)), dial_timeout(dial_timeout) {}

ConnectProxyServer::~ConnectProxyServer() {
    // Handlers use the interceptor
    stop();
    waitForHandlers();
}

// ====================================================================================================
// Main Request Handler
// ====================================================================================================
void ConnectProxyServer::handleRequest(int client_fd) {
    Logger logger(std::to_string(client_fd));

    // -------------------------------------------------------
    // STEP 1: Read and parse client request
    // -------------------------------------------------------
    HTTPRequest req;
    std::string leftover;
    std::string error;
    if (!HTTPRequestParser::readRequest(client_fd, req, leftover, error)) {
        if (error.empty()) {
            close(client_fd);  // Client disconnected
            return;
        }
        logger.warn("Rejecting request: {}", error);
        ResponseSink sink(client_fd);
        if (!sink.writeResponse(http_utils::StatusBadRequest, error + "\n")) {
            logger.debug("Unable to send 400 response");
        }
        return;
    }

    logger.logRequest(fmt::format("{} {} {}", req.method, req.target, req.version));

    auto downstream = std::make_unique<SocketConnection>(client_fd, std::move(leftover));
    if (interceptor.config().idleTimeout.count() > 0) {
        downstream->setIdleTimeout(interceptor.config().idleTimeout);
    }
    ResponseSink sink(std::move(downstream));

    // -------------------------------------------------------
    // STEP 2: Only CONNECT is proxied
    // -------------------------------------------------------
    if (!req.isConnect()) {
        logger.info("Rejecting {} request", req.method);
        sink.headers().set("Allow", "CONNECT");
        if (!sink.writeResponse(http_utils::StatusMethodNotAllowed, "Only CONNECT is supported\n")) {
            logger.debug("Unable to send 405 response");
        }
        return;
    }

    // -------------------------------------------------------
    // STEP 3: Tunnel
    // -------------------------------------------------------
    Context ctx = Context::withTimeout(dial_timeout);
    if (TunnelError err = interceptor.handle(ctx, sink, req, logger)) {
        logger.warn("CONNECT {} failed: {}", req.authority, err.logMessage());
    }
}

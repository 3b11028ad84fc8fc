#include "ConnectInterceptor.hpp"
#include "Relay.hpp"
#include "ResponseWriter.hpp"

#include <stdexcept>
#include <utility>

#include <fmt/format.h>

namespace {

// Closes whatever the session acquired, on every exit path
struct TunnelSession {
    explicit TunnelSession(Logger& logger) : logger(logger) {}

    ~TunnelSession() {
        closeQuietly(downstream, "downstream");
        closeQuietly(upstream, "upstream");
    }

    TunnelSession(const TunnelSession&) = delete;
    TunnelSession& operator=(const TunnelSession&) = delete;

    void closeQuietly(std::unique_ptr<Connection>& conn, const char* which) {
        if (!conn) {
            return;
        }
        std::error_code ec;
        conn->close(ec);
        if (ec) {
            logger.trace("Error closing {} connection: {}", which, ec.message());
        }
    }

    Logger& logger;
    std::unique_ptr<Connection> downstream;
    std::unique_ptr<Connection> upstream;
};

} // namespace

// ====================================================================================================
// Constructor
// ====================================================================================================

ConnectInterceptor::ConnectInterceptor(ConnectConfig config) : cfg(std::move(config)) {
    if (!cfg.dial) {
        throw std::invalid_argument("ConnectInterceptor requires a dial function");
    }
    if (!cfg.bufferSource) {
        cfg.bufferSource = std::make_shared<DefaultBufferSource>();
    }
}

// ====================================================================================================
// Request Handling
// ====================================================================================================

TunnelError ConnectInterceptor::handle(const Context& ctx, ResponseSink& sink, HTTPRequest& req, Logger& logger) const {
    TunnelSession session(logger);
    TunnelError err;

    // -------------------------------------------------------
    // STEP 1: Take the client connection
    // -------------------------------------------------------
    session.downstream = hijack(sink, err);
    if (!session.downstream) {
        return err;
    }

    // -------------------------------------------------------
    // STEP 2: Answer before dialing
    // -------------------------------------------------------
    if (!cfg.okWaitsForUpstream) {
        err = ResponseWriter::respondOK(*session.downstream, req, sink.headers(), cfg.idleTimeout, logger);
        if (err) {
            return err;
        }
    }

    // -------------------------------------------------------
    // STEP 3: Dial the request authority, never the Host header
    // -------------------------------------------------------
    session.upstream = cfg.dial(ctx, "tcp", req.authority, err);
    if (!session.upstream) {
        if (!err) {
            err = TunnelError(std::make_error_code(std::errc::host_unreachable), "Unable to reach upstream");
        }
        if (cfg.okWaitsForUpstream) {
            if (TunnelError write_err = ResponseWriter::respondBadGateway(*session.downstream, req, sink.headers(), err, logger)) {
                logger.debug("Unable to respond BadGateway: {}", write_err.logMessage());
            }
        }
        // Early OK: the client already has its 200, the caller logs the error
        return err;
    }
    err = {};

    // -------------------------------------------------------
    // STEP 4: Answer after dialing
    // -------------------------------------------------------
    if (cfg.okWaitsForUpstream) {
        err = ResponseWriter::respondOK(*session.downstream, req, sink.headers(), cfg.idleTimeout, logger);
        if (err) {
            return err;
        }
    }

    logger.logTunnelEstablished(req.authority);

    // -------------------------------------------------------
    // STEP 5: Relay until both sides are done
    // -------------------------------------------------------
    err = copy(*session.upstream, *session.downstream);
    logger.logTunnelClosed(req.authority);
    return err;
}

// ====================================================================================================
// Private Helper Methods
// ====================================================================================================

std::unique_ptr<Connection> ConnectInterceptor::hijack(ResponseSink& sink, TunnelError& err) const {
    std::error_code ec;
    std::unique_ptr<Connection> downstream = sink.hijack(ec);
    if (!downstream) {
        // Only possible if the sink was already hijacked or answered,
        // which is a programming error
        if (!ec) {
            ec = TunnelErrc::already_hijacked;
        }
        err = TunnelError(ec, fmt::format("Unable to hijack connection: {}", ec.message()));
        return nullptr;
    }
    return downstream;
}

TunnelError ConnectInterceptor::copy(Connection& upstream, Connection& downstream) const {
    // Pipe data between the client and the upstream
    BufferLease buf_out(*cfg.bufferSource);
    BufferLease buf_in(*cfg.bufferSource);

    auto [to_upstream, to_downstream] = Relay::bidiCopy(downstream, upstream, buf_out.buffer(), buf_in.buffer());

    if (!isBenignDownstreamError(to_downstream)) {
        return TunnelError(to_downstream, fmt::format("Error piping data to downstream: {}", to_downstream.message()));
    }
    if (!isBenignUpstreamError(to_upstream)) {
        return TunnelError(to_upstream, fmt::format("Error piping data to upstream: {}", to_upstream.message()));
    }
    return {};
}

bool ConnectInterceptor::isBenignDownstreamError(const std::error_code& ec) {
    // A client that goes away first shows up as a broken pipe here
    return !ec || ec == TunnelErrc::end_of_stream || ec == TunnelErrc::idled || ec == std::errc::broken_pipe;
}

bool ConnectInterceptor::isBenignUpstreamError(const std::error_code& ec) {
    return !ec || ec == TunnelErrc::end_of_stream || ec == TunnelErrc::idled;
}

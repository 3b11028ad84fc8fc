#ifndef CONNECT_INTERCEPTOR_HPP
#define CONNECT_INTERCEPTOR_HPP

#include "BufferSource.hpp"
#include "Connection.hpp"
#include "Context.hpp"
#include "HTTPRequest.hpp"
#include "Logger.hpp"
#include "NetworkUtils.hpp"
#include "ResponseSink.hpp"
#include "TunnelError.hpp"

#include <chrono>
#include <memory>
#include <system_error>

/**
 * ConnectConfig - Settings shared read-only by every CONNECT session
 */
struct ConnectConfig {
    // If nonzero, the 200 response carries a Keep-Alive timeout hint
    std::chrono::milliseconds idleTimeout{0};

    // Null means DefaultBufferSource
    std::shared_ptr<BufferSource> bufferSource;

    // Dial upstream before answering 200 (and answer 502 if the dial fails)
    bool okWaitsForUpstream = false;

    // Required
    DialFunc dial;
};

/**
 * ConnectInterceptor - Turns a CONNECT request into a raw tunnel
 *
 * Per request:
 * 1. Hijack the client connection out of the response sink
 * 2. Unless okWaitsForUpstream, answer 200 right away
 * 3. Dial the request authority (never the Host header)
 * 4. If okWaitsForUpstream, answer 200, or 502 if the dial failed
 * 5. Relay bytes both ways until both directions finish
 * 6. Close whatever was opened and return the relay buffers
 *
 * When 200 goes out before dialing and the dial then fails, the client only
 * sees the connection close.
 *
 * Thread safety: handle() may run concurrently for different requests.
 */
class ConnectInterceptor {
public:
    /**
     * @throws std::invalid_argument if config.dial is empty
     */
    explicit ConnectInterceptor(ConnectConfig config);

    /**
     * Handle one CONNECT request
     *
     * End-of-stream, idle timeouts and a client hanging up while data is
     * sent to it are normal endings and return success.
     *
     * @return Empty on success; otherwise the failure, for logging
     */
    TunnelError handle(const Context& ctx, ResponseSink& sink, HTTPRequest& req, Logger& logger) const;

    const ConnectConfig& config() const { return cfg; }

    /** Whether a relay result for the upstream -> downstream direction is a normal ending */
    static bool isBenignDownstreamError(const std::error_code& ec);

    /** Whether a relay result for the downstream -> upstream direction is a normal ending */
    static bool isBenignUpstreamError(const std::error_code& ec);

private:
    ConnectConfig cfg;

    std::unique_ptr<Connection> hijack(ResponseSink& sink, TunnelError& err) const;

    TunnelError copy(Connection& upstream, Connection& downstream) const;
};

#endif // CONNECT_INTERCEPTOR_HPP

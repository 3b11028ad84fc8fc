#ifndef NETWORK_UTILS_HPP
#define NETWORK_UTILS_HPP

#include "Connection.hpp"
#include "Context.hpp"
#include "TunnelError.hpp"

#include <netdb.h>

#include <functional>
#include <memory>
#include <string>

/**
 * Opens an outbound connection
 *
 * Must give up promptly once ctx is done. On failure returns nullptr and
 * sets err; err messages keep internal detail inside redaction::hide().
 */
using DialFunc = std::function<std::unique_ptr<Connection>(const Context& ctx,
                                                           const std::string& network,
                                                           const std::string& address,
                                                           TunnelError& err)>;

/**
 * Name resolution with getaddrinfo() semantics
 *
 * Returns 0 and a list to be released with freeaddrinfo(), or an EAI_* code.
 * May block; the dial waits on it from another thread.
 */
using Resolver = std::function<int(const std::string& host,
                                   const std::string& service,
                                   const addrinfo& hints,
                                   addrinfo** result)>;

/**
 * NetworkUtils - Common networking utility functions
 *
 * Provides reusable networking operations used across multiple components:
 * - Making outbound TCP connections bounded by a Context
 * - Socket mode helpers
 *
 * This is a utility class with static methods only.
 */
class NetworkUtils {
public:
    /** Granularity at which a connect in progress re-checks its Context */
    static constexpr int kDialPollSliceMs = 50;

    /**
     * Connect to a remote host
     *
     * Performs DNS resolution and tries each resolved address in turn with a
     * non-blocking connect bounded by the context. Supports both IPv4 and IPv6.
     *
     * Errors:
     * - unsupported_network: network is not "tcp", "tcp4" or "tcp6"
     * - bad_address: address is not host:port or [v6]:port
     * - host_not_found: resolution failed
     * - dial_timeout / dial_canceled: the context finished first
     * - system error of the last attempt (ECONNREFUSED, ENETUNREACH, ...)
     *
     * @param ctx Deadline and cancellation
     * @param network "tcp", "tcp4" or "tcp6"
     * @param address host:port
     * @param err Set on failure
     * @return Blocking-mode connection on success, nullptr on failure
     */
    static std::unique_ptr<Connection> dial(const Context& ctx,
                                            const std::string& network,
                                            const std::string& address,
                                            TunnelError& err);

    /**
     * dial() with a custom resolver in place of getaddrinfo()
     *
     * The lookup runs on its own thread; if ctx finishes first the dial
     * returns dial_timeout / dial_canceled and the late result is discarded.
     */
    static std::unique_ptr<Connection> dialWithResolver(const Context& ctx,
                                                        const std::string& network,
                                                        const std::string& address,
                                                        TunnelError& err,
                                                        const Resolver& resolve);

    /** The system resolver (getaddrinfo) */
    static int systemResolve(const std::string& host,
                             const std::string& service,
                             const addrinfo& hints,
                             addrinfo** result);

    /**
     * Switch a descriptor between blocking and non-blocking mode
     *
     * @return true on success, false on failure
     */
    static bool setBlocking(int fd, bool blocking);

private:
    // Utility class - no instances allowed
    NetworkUtils() = delete;
    ~NetworkUtils() = delete;
    NetworkUtils(const NetworkUtils&) = delete;
    NetworkUtils& operator=(const NetworkUtils&) = delete;
};

#endif // NETWORK_UTILS_HPP

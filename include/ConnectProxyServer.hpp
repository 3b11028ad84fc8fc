#ifndef CONNECT_PROXY_SERVER_HPP
#define CONNECT_PROXY_SERVER_HPP

#include "BaseServer.hpp"
#include "ConnectInterceptor.hpp"
#include <chrono>

/**
 * ConnectProxyServer - Multi-threaded HTTP proxy that only tunnels (CONNECT)
 *
 * Per accepted client:
 * - HTTPRequestParser reads one request head
 * - Malformed requests get 400, other methods get 405
 * - CONNECT goes to ConnectInterceptor with a Context bounded by the dial timeout
 *
 * With an idle timeout configured, the client connection is idle-timed so
 * that quiet tunnels end on their own.
 */
class ConnectProxyServer : public BaseServer {
public:
    /**
     * Constructor
     * @param port Port to listen on (0 picks one)
     * @param config CONNECT handler settings
     * @param dial_timeout Bound on each upstream dial
     */
    ConnectProxyServer(int port, ConnectConfig config, std::chrono::milliseconds dial_timeout);
    ~ConnectProxyServer() override;

protected:
    /**
     * Handle a client connection
     * This is called by BaseServer for each accepted connection
     *
     * @param client_fd Client socket file descriptor (ownership taken)
     */
    void handleRequest(int client_fd) override;

private:
    ConnectInterceptor interceptor;
    std::chrono::milliseconds dial_timeout;
};

#endif // CONNECT_PROXY_SERVER_HPP

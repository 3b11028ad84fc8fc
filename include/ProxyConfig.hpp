#ifndef PROXY_CONFIG_HPP
#define PROXY_CONFIG_HPP

#include "ConnectInterceptor.hpp"
#include "Logger.hpp"

#include <chrono>
#include <string>

/**
 * ProxyConfig - Command line options of the proxy process
 *
 *   --port N                  listen port (default 8080)
 *   --idle-timeout SECONDS    close tunnels idle this long, 0 = never (default 0)
 *   --dial-timeout SECONDS    give up dialing upstream after this long (default 30)
 *   --ok-waits-for-upstream   dial before answering 200, answer 502 on failure
 *   --pool-buffers            reuse relay buffers across tunnels
 *   --log-level LEVEL         trace|debug|info|warn|error (default info)
 *   --log-file PATH           also append log lines to PATH
 *   --help                    print usage
 */
struct ProxyConfig {
    int port = 8080;
    std::chrono::seconds idleTimeout{0};
    std::chrono::seconds dialTimeout{30};
    bool okWaitsForUpstream = false;
    bool poolBuffers = false;
    LogLevel logLevel = LogLevel::Info;
    std::string logFile;
    bool showHelp = false;

    /**
     * Parse argv
     *
     * @param error Reason for failure
     * @return true if every argument was understood
     */
    static bool parse(int argc, const char* const argv[], ProxyConfig& out, std::string& error);

    static std::string usage(const std::string& program);

    /** Settings for the CONNECT handler, dialing with NetworkUtils::dial */
    ConnectConfig toConnectConfig() const;
};

#endif // PROXY_CONFIG_HPP

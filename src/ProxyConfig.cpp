#include "ProxyConfig.hpp"
#include "StringUtils.hpp"

#include <memory>

#include <fmt/format.h>

using namespace utils;

bool ProxyConfig::parse(int argc, const char* const argv[], ProxyConfig& out, std::string& error) {
    ProxyConfig cfg;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        // Options taking a value
        auto value = [&](std::string_view& v) {
            if (i + 1 >= argc) {
                error = fmt::format("Missing value for {}", arg);
                return false;
            }
            v = argv[++i];
            return true;
        };

        std::string_view v;
        if (arg == "--help" || arg == "-h") {
            cfg.showHelp = true;
        } else if (arg == "--ok-waits-for-upstream") {
            cfg.okWaitsForUpstream = true;
        } else if (arg == "--pool-buffers") {
            cfg.poolBuffers = true;
        } else if (arg == "--port") {
            unsigned int port = 0;
            if (!value(v)) {
                return false;
            }
            if (!parseNumber(v, port) || port > 65535) {
                error = fmt::format("Invalid port number: {}", v);
                return false;
            }
            cfg.port = static_cast<int>(port);
        } else if (arg == "--idle-timeout" || arg == "--dial-timeout") {
            unsigned int seconds = 0;
            if (!value(v)) {
                return false;
            }
            if (!parseNumber(v, seconds)) {
                error = fmt::format("Invalid number of seconds for {}: {}", arg, v);
                return false;
            }
            if (arg == "--idle-timeout") {
                cfg.idleTimeout = std::chrono::seconds(seconds);
            } else {
                if (seconds == 0) {
                    error = "--dial-timeout must be positive";
                    return false;
                }
                cfg.dialTimeout = std::chrono::seconds(seconds);
            }
        } else if (arg == "--log-level") {
            if (!value(v)) {
                return false;
            }
            if (!Logger::parseLevel(v, cfg.logLevel)) {
                error = fmt::format("Unknown log level: {}", v);
                return false;
            }
        } else if (arg == "--log-file") {
            if (!value(v)) {
                return false;
            }
            cfg.logFile = std::string{v};
        } else {
            error = fmt::format("Unknown option: {}", arg);
            return false;
        }
    }

    out = cfg;
    return true;
}

std::string ProxyConfig::usage(const std::string& program) {
    return fmt::format(
        "Usage:\n"
        "  {} [options]\n"
        "\n"
        "Options:\n"
        "  --port N                  listen port (default 8080)\n"
        "  --idle-timeout SECONDS    close idle tunnels, 0 disables (default 0)\n"
        "  --dial-timeout SECONDS    upstream dial timeout (default 30)\n"
        "  --ok-waits-for-upstream   dial upstream before answering 200\n"
        "  --pool-buffers            reuse relay buffers\n"
        "  --log-level LEVEL         trace|debug|info|warn|error (default info)\n"
        "  --log-file PATH           append log lines to PATH\n"
        "  --help                    show this message\n",
        program);
}

ConnectConfig ProxyConfig::toConnectConfig() const {
    ConnectConfig connect;
    connect.idleTimeout = idleTimeout;
    connect.okWaitsForUpstream = okWaitsForUpstream;
    if (poolBuffers) {
        connect.bufferSource = std::make_shared<PooledBufferSource>();
    } else {
        connect.bufferSource = std::make_shared<DefaultBufferSource>();
    }
    connect.dial = &NetworkUtils::dial;
    return connect;
}

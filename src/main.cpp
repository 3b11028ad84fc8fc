#include <iostream>
#include <string>
#include "ConnectProxyServer.hpp"
#include "Logger.hpp"
#include "ProxyConfig.hpp"


int main(int argc, char* argv[]) {
    // Argument Parsing
    ProxyConfig config;
    std::string error;
    if (!ProxyConfig::parse(argc, argv, config, error)) {
        std::cerr << error << "\n\n" << ProxyConfig::usage(argv[0]);
        return 1;
    }
    if (config.showHelp) {
        std::cout << ProxyConfig::usage(argv[0]);
        return 0;
    }

    // Logging
    Logger::setLevel(config.logLevel);
    if (!Logger::setLogFile(config.logFile)) {
        std::cerr << "Cannot open log file " << config.logFile << "\n";
        return 1;
    }

    Logger logger("main");
    logger.info("Starting CONNECT proxy on port {} (idle timeout {}s, dial timeout {}s, ok waits for upstream: {})",
                config.port,
                config.idleTimeout.count(),
                config.dialTimeout.count(),
                config.okWaitsForUpstream);

    // CONNECT Proxy Server
    ConnectProxyServer server(config.port, config.toConnectConfig(), config.dialTimeout);
    if (!server.start()) {
        logger.error("Unable to listen on port {}", config.port);
        return 1;
    }

    return 0;
}

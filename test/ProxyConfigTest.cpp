#include "ProxyConfig.hpp"

#include <gtest/gtest.h>

#include <vector>

namespace {

bool parseArgs(std::vector<const char*> args, ProxyConfig& out, std::string& error) {
    args.insert(args.begin(), "tunnelproxy");
    return ProxyConfig::parse(static_cast<int>(args.size()), args.data(), out, error);
}

} // namespace

TEST(ProxyConfigTest, Defaults) {
    ProxyConfig cfg;
    std::string error;

    ASSERT_TRUE(parseArgs({}, cfg, error));

    EXPECT_EQ(cfg.port, 8080);
    EXPECT_EQ(cfg.idleTimeout.count(), 0);
    EXPECT_EQ(cfg.dialTimeout.count(), 30);
    EXPECT_FALSE(cfg.okWaitsForUpstream);
    EXPECT_FALSE(cfg.poolBuffers);
    EXPECT_EQ(cfg.logLevel, LogLevel::Info);
    EXPECT_TRUE(cfg.logFile.empty());
    EXPECT_FALSE(cfg.showHelp);
}

TEST(ProxyConfigTest, ParsesEveryOption) {
    ProxyConfig cfg;
    std::string error;

    ASSERT_TRUE(parseArgs({"--port", "3128", "--idle-timeout", "90", "--dial-timeout", "5",
                           "--ok-waits-for-upstream", "--pool-buffers", "--log-level", "debug",
                           "--log-file", "/tmp/proxy.log"},
                          cfg, error))
        << error;

    EXPECT_EQ(cfg.port, 3128);
    EXPECT_EQ(cfg.idleTimeout.count(), 90);
    EXPECT_EQ(cfg.dialTimeout.count(), 5);
    EXPECT_TRUE(cfg.okWaitsForUpstream);
    EXPECT_TRUE(cfg.poolBuffers);
    EXPECT_EQ(cfg.logLevel, LogLevel::Debug);
    EXPECT_EQ(cfg.logFile, "/tmp/proxy.log");
}

TEST(ProxyConfigTest, RejectsBadValues) {
    struct Case {
        std::vector<const char*> args;
        std::string error;
    };
    std::vector<Case> cases = {
        {{"--port", "99999"}, "Invalid port number: 99999"},
        {{"--port"}, "Missing value for --port"},
        {{"--idle-timeout", "-1"}, "Invalid number of seconds for --idle-timeout: -1"},
        {{"--dial-timeout", "0"}, "--dial-timeout must be positive"},
        {{"--log-level", "loud"}, "Unknown log level: loud"},
        {{"--verbose"}, "Unknown option: --verbose"},
    };

    for (const auto& c : cases) {
        ProxyConfig cfg;
        cfg.port = 1;
        std::string error;
        EXPECT_FALSE(parseArgs(c.args, cfg, error)) << c.error;
        EXPECT_EQ(error, c.error);
        EXPECT_EQ(cfg.port, 1);
    }
}

TEST(ProxyConfigTest, HelpFlag) {
    ProxyConfig cfg;
    std::string error;

    ASSERT_TRUE(parseArgs({"-h"}, cfg, error));
    EXPECT_TRUE(cfg.showHelp);
    EXPECT_NE(ProxyConfig::usage("tunnelproxy").find("--ok-waits-for-upstream"), std::string::npos);
}

TEST(ProxyConfigTest, BuildsConnectConfig) {
    ProxyConfig cfg;
    cfg.idleTimeout = std::chrono::seconds(45);
    cfg.okWaitsForUpstream = true;
    cfg.poolBuffers = true;

    ConnectConfig connect = cfg.toConnectConfig();

    EXPECT_EQ(connect.idleTimeout, std::chrono::milliseconds(45000));
    EXPECT_TRUE(connect.okWaitsForUpstream);
    EXPECT_TRUE(connect.dial);
    EXPECT_NE(dynamic_cast<PooledBufferSource*>(connect.bufferSource.get()), nullptr);

    cfg.poolBuffers = false;
    EXPECT_NE(dynamic_cast<DefaultBufferSource*>(cfg.toConnectConfig().bufferSource.get()), nullptr);
}

TEST(LoggerTest, ParsesLevelNames) {
    LogLevel level = LogLevel::Info;

    EXPECT_TRUE(Logger::parseLevel("trace", level));
    EXPECT_EQ(level, LogLevel::Trace);
    EXPECT_TRUE(Logger::parseLevel("WARN", level));
    EXPECT_EQ(level, LogLevel::Warn);
    EXPECT_FALSE(Logger::parseLevel("verbose", level));
    EXPECT_EQ(level, LogLevel::Warn);
}

#include "ResponseWriter.hpp"
#include "Redaction.hpp"

#include <gtest/gtest.h>

#include "TestSupport.hpp"

using namespace test_support;
using namespace std::chrono_literals;

class ResponseWriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::setLevel(LogLevel::Error);
        req.method = "CONNECT";
        req.target = req.authority = "example.com:443";
        req.version = "HTTP/1.1";
    }

    HTTPRequest req;
    Logger logger{"test"};
    ScriptedConnection conn;
};

TEST_F(ResponseWriterTest, KeepAliveLeavesMarginBelowIdleTimeout) {
    HTTPHeaders headers;
    ResponseWriter::addIdleKeepAlive(headers, 30s);
    EXPECT_EQ(headers.get("Keep-Alive"), "timeout=28");

    ResponseWriter::addIdleKeepAlive(headers, 2500ms);
    EXPECT_EQ(headers.get("Keep-Alive"), "timeout=1");
    EXPECT_EQ(headers.size(), 1U);
}

TEST_F(ResponseWriterTest, KeepAliveIsAtLeastOneSecond) {
    HTTPHeaders headers;
    ResponseWriter::addIdleKeepAlive(headers, 1s);
    EXPECT_EQ(headers.get("Keep-Alive"), "timeout=1");

    HTTPHeaders subsecond;
    ResponseWriter::addIdleKeepAlive(subsecond, 200ms);
    EXPECT_EQ(subsecond.get("Keep-Alive"), "timeout=1");
}

TEST_F(ResponseWriterTest, NoKeepAliveWithoutIdleTimeout) {
    HTTPHeaders headers;
    ResponseWriter::addIdleKeepAlive(headers, 0ms);
    EXPECT_FALSE(headers.has("Keep-Alive"));
}

TEST_F(ResponseWriterTest, OkHasNoContentLength) {
    HTTPHeaders headers;
    headers.set("Content-Length", "0");
    headers.set("X-Proxy", "tunnelproxy");

    ASSERT_FALSE(ResponseWriter::respondOK(conn, req, headers, 0ms, logger));

    EXPECT_EQ(conn.writtenData(), "HTTP/1.1 200 OK\r\nX-Proxy: tunnelproxy\r\n\r\n");
}

TEST_F(ResponseWriterTest, OkCarriesKeepAlive) {
    HTTPHeaders headers;

    ASSERT_FALSE(ResponseWriter::respondOK(conn, req, headers, 10s, logger));

    EXPECT_EQ(conn.writtenData(), "HTTP/1.1 200 OK\r\nKeep-Alive: timeout=8\r\n\r\n");
    EXPECT_EQ(headers.get("Keep-Alive"), "timeout=8");
}

TEST_F(ResponseWriterTest, OkWriteFailureIsWrapped) {
    conn.write_error = std::make_error_code(std::errc::broken_pipe);
    HTTPHeaders headers;

    TunnelError err = ResponseWriter::respondOK(conn, req, headers, 0ms, logger);

    ASSERT_TRUE(err);
    EXPECT_EQ(err.code(), std::errc::broken_pipe);
    EXPECT_EQ(err.logMessage().rfind("Unable to respond OK: ", 0), 0U);
}

TEST_F(ResponseWriterTest, BadGatewayBodyIsRedacted) {
    HTTPHeaders headers;
    headers.set("X-Proxy", "tunnelproxy");
    TunnelError cause(std::make_error_code(std::errc::connection_refused),
                      "Unable to reach upstream" + redaction::hide(": dial tcp 10.9.8.7:443: Connection refused"));

    ASSERT_FALSE(ResponseWriter::respondBadGateway(conn, req, headers, cause, logger));

    EXPECT_EQ(conn.writtenData(),
              "HTTP/1.1 502 Bad Gateway\r\n"
              "X-Proxy: tunnelproxy\r\n"
              "Connection: close\r\n"
              "Content-Type: text/plain; charset=utf-8\r\n"
              "Content-Length: 24\r\n"
              "\r\n"
              "Unable to reach upstream");
    EXPECT_FALSE(headers.has("Connection"));
}

TEST_F(ResponseWriterTest, ClosesRequestBodyEvenWhenWriteFails) {
    req.body = std::make_unique<BufferedBody>("payload");
    conn.write_error = std::make_error_code(std::errc::connection_reset);

    TunnelError err = ResponseWriter::respond(conn, req, 200, HTTPHeaders{}, std::nullopt, logger);

    EXPECT_TRUE(err);
    EXPECT_TRUE(req.body->closed());
}

TEST_F(ResponseWriterTest, ClosesRequestBodyOnce) {
    req.body = std::make_unique<BufferedBody>("payload");

    EXPECT_FALSE(ResponseWriter::respond(conn, req, 200, HTTPHeaders{}, std::nullopt, logger));
    EXPECT_TRUE(req.body->closed());

    // A second response does not close it again
    EXPECT_FALSE(ResponseWriter::respond(conn, req, 200, HTTPHeaders{}, std::nullopt, logger));
    EXPECT_EQ(req.body->close(), TunnelErrc::already_closed);
}

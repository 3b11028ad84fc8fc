#include "Relay.hpp"

#include <gtest/gtest.h>

#include <functional>
#include <system_error>
#include <thread>

#include "TestSupport.hpp"

using namespace test_support;
using namespace std::chrono_literals;

TEST(RelayTest, CopyCountsBytesUntilEndOfStream) {
    ScriptedConnection src;
    src.chunks = {"abc", "defg"};
    ScriptedConnection dst;
    Buffer buf(2);

    size_t copied = 0;
    std::error_code ec = Relay::copy(dst, src, buf, copied);

    EXPECT_FALSE(ec);
    EXPECT_EQ(copied, 7U);
    EXPECT_EQ(dst.writtenData(), "abcdefg");
}

TEST(RelayTest, CopyStopsOnWriteError) {
    ScriptedConnection src;
    src.chunks = {"abc", "def"};
    ScriptedConnection dst;
    dst.write_error = std::make_error_code(std::errc::broken_pipe);
    dst.fail_writes_after = 1;
    Buffer buf(16);

    size_t copied = 0;
    std::error_code ec = Relay::copy(dst, src, buf, copied);

    EXPECT_EQ(ec, std::errc::broken_pipe);
    EXPECT_EQ(copied, 3U);
    EXPECT_EQ(dst.writtenData(), "abc");
}

TEST(RelayTest, CopyReturnsReadError) {
    ScriptedConnection src;
    src.chunks = {"x"};
    src.read_result = std::make_error_code(std::errc::connection_reset);
    ScriptedConnection dst;
    Buffer buf(16);

    size_t copied = 0;
    EXPECT_EQ(Relay::copy(dst, src, buf, copied), std::errc::connection_reset);
    EXPECT_EQ(copied, 1U);
}

TEST(RelayTest, BidiCopyRelaysBothWaysAndPropagatesHalfClose) {
    SocketPair left;   // fds[0] is the client, fds[1] the relay side
    SocketPair right;  // fds[0] is the relay side, fds[1] the server
    SocketConnection a(left.release(1));
    SocketConnection b(right.release(0));
    Buffer bufAtoB(64);
    Buffer bufBtoA(64);

    std::pair<std::error_code, std::error_code> result;
    std::thread relay([&] { result = Relay::bidiCopy(a, b, bufAtoB, bufBtoA); });

    std::string request = pattern(10000);
    ASSERT_TRUE(writeAll(left.fds[0], request));
    ::shutdown(left.fds[0], SHUT_WR);
    EXPECT_EQ(readAll(right.fds[1], 5s), request);

    ASSERT_TRUE(writeAll(right.fds[1], "response"));
    ::shutdown(right.fds[1], SHUT_WR);
    EXPECT_EQ(readAll(left.fds[0], 5s), "response");

    relay.join();
    EXPECT_FALSE(result.first);
    EXPECT_FALSE(result.second);
}

TEST(RelayTest, BidiCopyErrorInterruptsOtherDirection) {
    ScriptedConnection a;
    a.read_result = std::make_error_code(std::errc::connection_reset);
    SocketPair right;
    SocketConnection b(right.release(0));
    Buffer bufAtoB(64);
    Buffer bufBtoA(64);

    // b -> a would block forever on a silent peer without the interrupt
    auto result = Relay::bidiCopy(a, b, bufAtoB, bufBtoA);

    EXPECT_EQ(result.first, std::errc::connection_reset);
    EXPECT_FALSE(result.second);
    EXPECT_TRUE(a.interrupted);
    EXPECT_EQ(readAll(right.fds[1], 2s), "");
}

TEST(RelayTest, BidiCopyReportsWorkerStartFailure) {
    ScriptedConnection a;
    a.chunks = {"to b"};
    ScriptedConnection b;
    b.chunks = {"to a"};
    Buffer bufAtoB(64);
    Buffer bufBtoA(64);
    auto no_threads = [](std::function<void()>) -> std::thread {
        throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again));
    };

    auto result = Relay::bidiCopy(a, b, bufAtoB, bufBtoA, no_threads);

    EXPECT_EQ(result.first, std::errc::resource_unavailable_try_again);
    EXPECT_EQ(result.second, std::errc::resource_unavailable_try_again);
    EXPECT_EQ(a.writtenData(), "");
    EXPECT_EQ(b.writtenData(), "");
    EXPECT_FALSE(a.write_closed);
    EXPECT_FALSE(b.write_closed);
}

#ifndef CONNECTION_HPP
#define CONNECTION_HPP

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <system_error>

/**
 * Connection - A duplex byte stream
 *
 * Reads and writes may run concurrently on different threads (one reader,
 * one writer). read() returns 0 with an empty error code at end-of-stream.
 * close() releases the transport and must be called at most once; the
 * second call reports TunnelErrc::already_closed.
 */
class Connection {
public:
    virtual ~Connection() = default;

    virtual size_t read(char* buf, size_t len, std::error_code& ec) = 0;

    /** Write all of buf, or set ec */
    virtual size_t write(const char* buf, size_t len, std::error_code& ec) = 0;

    /** Half-close: the peer sees end-of-stream, reads continue to work */
    virtual void closeWrite() = 0;

    /** Shut down both directions so that blocked reads and writes return */
    virtual void interrupt() = 0;

    virtual void close(std::error_code& ec) = 0;

    /** Endpoints, for log lines */
    virtual std::string description() const = 0;
};

/**
 * SocketConnection - Connection over a connected POSIX stream socket
 *
 * Takes ownership of the descriptor. Bytes passed as `pending` were read
 * from the socket ahead of time (e.g. pipelined after an HTTP head) and
 * are returned by read() before the socket is touched.
 *
 * With an idle timeout set, a read that sees no traffic in either
 * direction for the whole timeout shuts the socket down and fails with
 * TunnelErrc::idled.
 */
class SocketConnection : public Connection {
public:
    explicit SocketConnection(int fd, std::string pending = {});
    ~SocketConnection() override;

    SocketConnection(const SocketConnection&) = delete;
    SocketConnection& operator=(const SocketConnection&) = delete;

    size_t read(char* buf, size_t len, std::error_code& ec) override;
    size_t write(const char* buf, size_t len, std::error_code& ec) override;
    void closeWrite() override;
    void interrupt() override;
    void close(std::error_code& ec) override;
    std::string description() const override;

    /** Zero disables idle timing */
    void setIdleTimeout(std::chrono::milliseconds timeout);

    int fd() const { return fd_; }

private:
    void touch();
    std::chrono::milliseconds idleFor() const;

    int fd_;
    std::string pending_;
    size_t pending_offset_ = 0;
    std::chrono::milliseconds idle_timeout_{0};
    std::atomic<int64_t> last_activity_ns_;
    std::atomic<bool> idled_{false};
    std::atomic<bool> closed_{false};
};

#endif // CONNECTION_HPP

#include "Connection.hpp"
#include "TunnelError.hpp"

#include <sys/socket.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstring>
#include <utility>

#include <fmt/format.h>

namespace {

int64_t nowNanos() {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
}

std::error_code lastSystemError() {
    return {errno, std::system_category()};
}

std::string formatEndpoint(const sockaddr_storage& addr) {
    char host[INET6_ADDRSTRLEN] = {};
    if (addr.ss_family == AF_INET) {
        const auto* in = reinterpret_cast<const sockaddr_in*>(&addr);
        inet_ntop(AF_INET, &in->sin_addr, host, sizeof(host));
        return fmt::format("{}:{}", host, ntohs(in->sin_port));
    }
    if (addr.ss_family == AF_INET6) {
        const auto* in6 = reinterpret_cast<const sockaddr_in6*>(&addr);
        inet_ntop(AF_INET6, &in6->sin6_addr, host, sizeof(host));
        return fmt::format("[{}]:{}", host, ntohs(in6->sin6_port));
    }
    if (addr.ss_family == AF_UNIX) {
        return "unix";
    }
    return "?";
}

} // namespace

// ====================================================================================================
// Lifecycle
// ====================================================================================================

SocketConnection::SocketConnection(int fd, std::string pending)
    : fd_(fd), pending_(std::move(pending)), last_activity_ns_(nowNanos()) {}

SocketConnection::~SocketConnection() {
    if (!closed_.exchange(true)) {
        ::close(fd_);
    }
}

void SocketConnection::setIdleTimeout(std::chrono::milliseconds timeout) {
    idle_timeout_ = timeout;
    touch();
}

void SocketConnection::close(std::error_code& ec) {
    if (closed_.exchange(true)) {
        ec = TunnelErrc::already_closed;
        return;
    }
    if (::close(fd_) < 0) {
        ec = lastSystemError();
    }
}

// ====================================================================================================
// Data Transfer
// ====================================================================================================

size_t SocketConnection::read(char* buf, size_t len, std::error_code& ec) {
    if (pending_offset_ < pending_.size()) {
        size_t n = std::min(len, pending_.size() - pending_offset_);
        std::memcpy(buf, pending_.data() + pending_offset_, n);
        pending_offset_ += n;
        if (pending_offset_ == pending_.size()) {
            pending_.clear();
            pending_offset_ = 0;
        }
        touch();
        return n;
    }

    while (true) {
        if (idled_) {
            ec = TunnelErrc::idled;
            return 0;
        }

        if (idle_timeout_.count() > 0) {
            auto left = idle_timeout_ - idleFor();
            if (left.count() <= 0) {
                // Nothing moved either way for the whole timeout
                idled_ = true;
                interrupt();
                ec = TunnelErrc::idled;
                return 0;
            }

            pollfd pfd{fd_, POLLIN, 0};
            // poll() takes an int; longer waits just re-check on wakeup
            int wait_ms = static_cast<int>(std::min<long long>(left.count(), INT_MAX));
            int ready = ::poll(&pfd, 1, wait_ms);
            if (ready < 0) {
                if (errno == EINTR) {
                    continue;
                }
                ec = lastSystemError();
                return 0;
            }
            if (ready == 0) {
                continue;  // re-check, the write side may have been active
            }
        }

        ssize_t n = ::recv(fd_, buf, len, 0);
        if (n > 0) {
            touch();
            return static_cast<size_t>(n);
        }
        if (n == 0) {
            if (idled_) {
                ec = TunnelErrc::idled;
            }
            return 0;
        }
        if (errno == EINTR) {
            continue;
        }
        ec = lastSystemError();
        return 0;
    }
}

size_t SocketConnection::write(const char* buf, size_t len, std::error_code& ec) {
    size_t total_sent = 0;

    while (total_sent < len) {
        ssize_t sent = ::send(fd_, buf + total_sent, len - total_sent, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) {
                continue;
            }
            ec = (idled_ ? std::error_code(TunnelErrc::idled) : lastSystemError());
            return total_sent;
        }
        total_sent += static_cast<size_t>(sent);
        touch();
    }

    return total_sent;
}

void SocketConnection::closeWrite() {
    ::shutdown(fd_, SHUT_WR);
}

void SocketConnection::interrupt() {
    ::shutdown(fd_, SHUT_RDWR);
}

std::string SocketConnection::description() const {
    sockaddr_storage local{};
    sockaddr_storage remote{};
    socklen_t local_len = sizeof(local);
    socklen_t remote_len = sizeof(remote);
    if (getsockname(fd_, reinterpret_cast<sockaddr*>(&local), &local_len) < 0 ||
        getpeername(fd_, reinterpret_cast<sockaddr*>(&remote), &remote_len) < 0) {
        return fmt::format("fd {}", fd_);
    }
    return fmt::format("{} -> {}", formatEndpoint(local), formatEndpoint(remote));
}

// ====================================================================================================
// Idle Timing
// ====================================================================================================

void SocketConnection::touch() {
    last_activity_ns_.store(nowNanos());
}

std::chrono::milliseconds SocketConnection::idleFor() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::nanoseconds(nowNanos() - last_activity_ns_.load()));
}

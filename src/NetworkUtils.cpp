#include "NetworkUtils.hpp"
#include "HTTPUtils.hpp"
#include "Redaction.hpp"

#include <sys/socket.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <fcntl.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <system_error>
#include <thread>

#include <fmt/format.h>

namespace {

std::string formatAddress(const addrinfo* ai) {
    char host[INET6_ADDRSTRLEN] = {};
    if (ai->ai_family == AF_INET6) {
        const auto* in6 = reinterpret_cast<const sockaddr_in6*>(ai->ai_addr);
        inet_ntop(AF_INET6, &in6->sin6_addr, host, sizeof(host));
        return fmt::format("[{}]:{}", host, ntohs(in6->sin6_port));
    }
    const auto* in = reinterpret_cast<const sockaddr_in*>(ai->ai_addr);
    inet_ntop(AF_INET, &in->sin_addr, host, sizeof(host));
    return fmt::format("{}:{}", host, ntohs(in->sin_port));
}

// Nonzero error if the context is finished
TunnelError contextError(const Context& ctx, const std::string& address) {
    if (ctx.isCanceled()) {
        return TunnelError(TunnelErrc::dial_canceled,
                           "Dial canceled" + redaction::hide(fmt::format(": dial tcp {}", address)));
    }
    if (ctx.isExpired()) {
        return TunnelError(TunnelErrc::dial_timeout,
                           "Timed out reaching upstream" + redaction::hide(fmt::format(": dial tcp {}: i/o timeout", address)));
    }
    return {};
}

struct AddrInfoDeleter {
    void operator()(addrinfo* res) const { freeaddrinfo(res); }
};

// How long to block before looking at the context again
int waitSliceMs(const Context& ctx) {
    int wait_ms = NetworkUtils::kDialPollSliceMs;
    if (auto left = ctx.remaining()) {
        wait_ms = static_cast<int>(std::min<long long>(left->count(), NetworkUtils::kDialPollSliceMs));
    }
    return wait_ms;
}

// A lookup shared between the dial and its resolver thread.
// If the dial gives up first, the resolver thread frees the late result.
struct PendingLookup {
    std::mutex mutex;
    std::condition_variable finished;
    bool done = false;
    bool abandoned = false;
    int rc = 0;
    addrinfo* result = nullptr;
};

/**
 * Resolve host:service on a separate thread, waiting for it in slices
 *
 * @param err Set to dial_timeout / dial_canceled if ctx finishes first
 * @return The resolver's EAI code (meaningless when err is set)
 */
int lookup(const Context& ctx,
           const std::string& address,
           const std::string& host,
           const std::string& service,
           const addrinfo& hints,
           const Resolver& resolve,
           addrinfo** result,
           TunnelError& err) {
    auto pending = std::make_shared<PendingLookup>();
    auto task = [pending, resolve, host, service, hints] {
        addrinfo* res = nullptr;
        int rc = resolve(host, service, hints, &res);

        std::lock_guard<std::mutex> lock(pending->mutex);
        if (pending->abandoned) {
            if (rc == 0 && res != nullptr) {
                freeaddrinfo(res);
            }
            return;
        }
        pending->rc = rc;
        pending->result = res;
        pending->done = true;
        pending->finished.notify_all();
    };

    try {
        std::thread(task).detach();
    } catch (const std::system_error&) {
        // Out of threads: resolve on this one, the context is checked afterwards
        task();
    }

    std::unique_lock<std::mutex> lock(pending->mutex);
    while (!pending->done) {
        if ((err = contextError(ctx, address))) {
            pending->abandoned = true;
            return EAI_AGAIN;
        }
        pending->finished.wait_for(lock, std::chrono::milliseconds(waitSliceMs(ctx)));
    }
    *result = pending->result;
    return pending->rc;
}

} // namespace

// ====================================================================================================
// Connection Management
// ====================================================================================================

std::unique_ptr<Connection> NetworkUtils::dial(const Context& ctx,
                                               const std::string& network,
                                               const std::string& address,
                                               TunnelError& err) {
    return dialWithResolver(ctx, network, address, err, &NetworkUtils::systemResolve);
}

int NetworkUtils::systemResolve(const std::string& host,
                                const std::string& service,
                                const addrinfo& hints,
                                addrinfo** result) {
    return getaddrinfo(host.c_str(), service.c_str(), &hints, result);
}

std::unique_ptr<Connection> NetworkUtils::dialWithResolver(const Context& ctx,
                                                           const std::string& network,
                                                           const std::string& address,
                                                           TunnelError& err,
                                                           const Resolver& resolve) {
    err = {};

    struct addrinfo hints {};
    hints.ai_socktype = SOCK_STREAM;  // TCP
    if (network == "tcp") {
        hints.ai_family = AF_UNSPEC;  // IPv4 or IPv6
    } else if (network == "tcp4") {
        hints.ai_family = AF_INET;
    } else if (network == "tcp6") {
        hints.ai_family = AF_INET6;
    } else {
        err = TunnelError(TunnelErrc::unsupported_network, fmt::format("Unsupported network {}", network));
        return nullptr;
    }

    std::string host;
    int port = 0;
    if (!http_utils::splitHostPort(address, host, port)) {
        err = TunnelError(TunnelErrc::bad_address, "Invalid upstream address" + redaction::hide(fmt::format(": {}", address)));
        return nullptr;
    }

    if ((err = contextError(ctx, address))) {
        return nullptr;
    }

    // Perform DNS resolution, bounded by the context
    struct addrinfo* raw = nullptr;
    int gai = lookup(ctx, address, host, std::to_string(port), hints, resolve, &raw, err);
    if (err) {
        return nullptr;
    }
    if (gai != 0) {
        // A lookup that outlived the context failed because of it
        if ((err = contextError(ctx, address))) {
            return nullptr;
        }
        err = TunnelError(TunnelErrc::host_not_found,
                          "Unable to resolve upstream" + redaction::hide(fmt::format(": lookup {}: {}", host, gai_strerror(gai))));
        return nullptr;
    }
    std::unique_ptr<addrinfo, AddrInfoDeleter> res(raw);

    std::error_code last_ec;
    std::string last_addr = address;

    for (const addrinfo* ai = res.get(); ai != nullptr; ai = ai->ai_next) {
        if ((err = contextError(ctx, address))) {
            return nullptr;
        }

        last_addr = formatAddress(ai);

        // Create socket
        int sock_fd = socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (sock_fd < 0) {
            last_ec = std::error_code(errno, std::system_category());
            continue;
        }
        if (!setBlocking(sock_fd, false)) {
            last_ec = std::error_code(errno, std::system_category());
            close(sock_fd);
            continue;
        }

        // Connect to remote host
        int rc = connect(sock_fd, ai->ai_addr, ai->ai_addrlen);
        if (rc < 0 && errno != EINPROGRESS) {
            last_ec = std::error_code(errno, std::system_category());
            close(sock_fd);
            continue;
        }

        // Wait for the connect to finish, watching the context
        while (rc < 0) {
            int wait_ms = waitSliceMs(ctx);
            if ((err = contextError(ctx, address))) {
                close(sock_fd);
                return nullptr;
            }

            pollfd pfd{sock_fd, POLLOUT, 0};
            int ready = poll(&pfd, 1, wait_ms);
            if (ready < 0 && errno != EINTR) {
                last_ec = std::error_code(errno, std::system_category());
                break;
            }
            if (ready <= 0) {
                continue;
            }

            int so_error = 0;
            socklen_t len = sizeof(so_error);
            if (getsockopt(sock_fd, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0) {
                so_error = errno;
            }
            if (so_error != 0) {
                last_ec = std::error_code(so_error, std::system_category());
                break;
            }
            rc = 0;
        }

        if (rc < 0 || !setBlocking(sock_fd, true)) {
            if (rc == 0) {
                last_ec = std::error_code(errno, std::system_category());
            }
            close(sock_fd);
            continue;
        }

        return std::make_unique<SocketConnection>(sock_fd);
    }

    if (!last_ec) {
        last_ec = std::make_error_code(std::errc::host_unreachable);
    }
    err = TunnelError(last_ec,
                      "Unable to reach upstream" + redaction::hide(fmt::format(": dial tcp {}: {}", last_addr, last_ec.message())));
    return nullptr;
}

// ====================================================================================================
// Socket Configuration
// ====================================================================================================

bool NetworkUtils::setBlocking(int fd, bool blocking) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) {
        return false;
    }
    flags = blocking ? (flags & ~O_NONBLOCK) : (flags | O_NONBLOCK);
    return fcntl(fd, F_SETFL, flags) == 0;
}

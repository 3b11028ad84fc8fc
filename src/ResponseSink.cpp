#include "ResponseSink.hpp"
#include "HTTPUtils.hpp"
#include "TunnelError.hpp"

#include <utility>

#include <fmt/format.h>

ResponseSink::ResponseSink(int client_fd, std::string pending)
    : connection(std::make_unique<SocketConnection>(client_fd, std::move(pending))) {}

ResponseSink::ResponseSink(std::unique_ptr<Connection> connection)
    : connection(std::move(connection)) {}

// An un-hijacked connection is closed by its own destructor
ResponseSink::~ResponseSink() = default;

std::unique_ptr<Connection> ResponseSink::hijack(std::error_code& ec) {
    switch (current) {
        case State::Hijacked:
            ec = TunnelErrc::already_hijacked;
            return nullptr;
        case State::ResponseStarted:
            ec = TunnelErrc::response_started;
            return nullptr;
        case State::Open:
            break;
    }
    current = State::Hijacked;
    return std::move(connection);
}

bool ResponseSink::writeResponse(int status_code, const std::string& body) {
    if (current != State::Open) {
        return false;
    }
    current = State::ResponseStarted;

    response_headers.set("Content-Type", "text/plain; charset=utf-8");
    response_headers.set("Content-Length", std::to_string(body.size()));
    response_headers.set("Connection", "close");

    std::string response = fmt::format("HTTP/1.1 {} {}\r\n{}\r\n{}",
                                       status_code,
                                       http_utils::statusText(status_code),
                                       response_headers.serialize(),
                                       body);

    std::error_code ec;
    connection->write(response.data(), response.size(), ec);
    return !ec;
}

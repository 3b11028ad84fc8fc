#ifndef TUNNEL_ERROR_HPP
#define TUNNEL_ERROR_HPP

#include <string>
#include <system_error>

/**
 * TunnelErrc - Error conditions raised by the tunnel itself
 *
 * System failures (ECONNREFUSED, EPIPE, ...) travel as std::system_category
 * codes; these cover everything that has no errno equivalent.
 */
enum class TunnelErrc {
    idled = 1,             // connection closed after the idle timeout elapsed
    end_of_stream,         // peer closed while a full message was expected
    already_hijacked,      // response sink was already upgraded
    response_started,      // response sink already wrote a normal response
    already_closed,        // connection closed twice
    dial_timeout,          // context deadline passed while dialing
    dial_canceled,         // context canceled while dialing
    host_not_found,        // name resolution failed
    unsupported_network,   // dial network other than tcp/tcp4/tcp6
    bad_address            // dial address is not host:port
};

const std::error_category& tunnel_category() noexcept;

std::error_code make_error_code(TunnelErrc e) noexcept;

namespace std {
template <>
struct is_error_code_enum<TunnelErrc> : true_type {};
} // namespace std

/**
 * TunnelError - An error code paired with a descriptive message
 *
 * An empty TunnelError means success. The message may contain segments
 * wrapped with redaction::hide(); use logMessage() for logs and
 * publicMessage() for anything sent to the client.
 */
class TunnelError {
public:
    TunnelError() = default;
    TunnelError(std::error_code code, std::string message);

    explicit operator bool() const { return static_cast<bool>(code_); }

    const std::error_code& code() const { return code_; }
    const std::string& message() const { return message_; }

    /** Full detail, markers removed */
    std::string logMessage() const;

    /** Hidden segments stripped */
    std::string publicMessage() const;

    /** Prefix the message, keeping the code */
    TunnelError wrap(const std::string& context) const;

private:
    std::error_code code_;
    std::string message_;
};

#endif // TUNNEL_ERROR_HPP

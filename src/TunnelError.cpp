#include "TunnelError.hpp"
#include "Redaction.hpp"

#include <utility>

namespace {

class TunnelCategory : public std::error_category {
public:
    const char* name() const noexcept override { return "tunnel"; }

    std::string message(int value) const override {
        switch (static_cast<TunnelErrc>(value)) {
            case TunnelErrc::idled:
                return "connection idled";
            case TunnelErrc::end_of_stream:
                return "unexpected end of stream";
            case TunnelErrc::already_hijacked:
                return "connection already hijacked";
            case TunnelErrc::response_started:
                return "response already started";
            case TunnelErrc::already_closed:
                return "connection already closed";
            case TunnelErrc::dial_timeout:
                return "dial timed out";
            case TunnelErrc::dial_canceled:
                return "dial canceled";
            case TunnelErrc::host_not_found:
                return "host not found";
            case TunnelErrc::unsupported_network:
                return "unsupported network";
            case TunnelErrc::bad_address:
                return "bad address";
        }
        return "unknown tunnel error";
    }
};

} // namespace

const std::error_category& tunnel_category() noexcept {
    static const TunnelCategory category;
    return category;
}

std::error_code make_error_code(TunnelErrc e) noexcept {
    return {static_cast<int>(e), tunnel_category()};
}

// ====================================================================================================
// TunnelError
// ====================================================================================================

TunnelError::TunnelError(std::error_code code, std::string message)
    : code_(code), message_(std::move(message)) {}

std::string TunnelError::logMessage() const {
    return redaction::reveal(message_);
}

std::string TunnelError::publicMessage() const {
    return redaction::clean(message_);
}

TunnelError TunnelError::wrap(const std::string& context) const {
    return TunnelError(code_, context + message_);
}

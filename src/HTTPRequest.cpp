#include "HTTPRequest.hpp"
#include "TunnelError.hpp"

std::error_code BufferedBody::close() {
    if (is_closed) {
        return TunnelErrc::already_closed;
    }
    is_closed = true;
    data.clear();
    data.shrink_to_fit();
    return {};
}

#ifndef HTTP_REQUEST_HPP
#define HTTP_REQUEST_HPP

#include "HTTPHeaders.hpp"

#include <memory>
#include <string>
#include <system_error>
#include <utility>

/**
 * RequestBody - The body of an incoming request
 *
 * Whoever answers the request closes the body, whether or not it was read.
 */
class RequestBody {
public:
    virtual ~RequestBody() = default;

    virtual std::error_code close() = 0;
    virtual bool closed() const = 0;
};

/**
 * BufferedBody - A body that was read into memory along with the head
 */
class BufferedBody : public RequestBody {
public:
    explicit BufferedBody(std::string data) : data(std::move(data)) {}

    std::error_code close() override;
    bool closed() const override { return is_closed; }

    const std::string& contents() const { return data; }

private:
    std::string data;
    bool is_closed = false;
};

/**
 * HTTPRequest - A parsed request head plus its optional body
 *
 * For CONNECT, `authority` is the request-target (host:port). It is the
 * only source for the tunnel destination; the Host header may have been
 * rewritten by an intermediary and is never used for dialing.
 */
struct HTTPRequest {
    std::string method;
    std::string target;
    std::string authority;
    std::string version;
    HTTPHeaders headers;
    std::unique_ptr<RequestBody> body;

    bool isConnect() const { return method == "CONNECT"; }
};

#endif // HTTP_REQUEST_HPP

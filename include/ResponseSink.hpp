#ifndef RESPONSE_SINK_HPP
#define RESPONSE_SINK_HPP

#include "Connection.hpp"
#include "HTTPHeaders.hpp"

#include <memory>
#include <string>
#include <system_error>

/**
 * ResponseSink - Where the answer to one request goes
 *
 * Either a normal response is written through writeResponse(), or the raw
 * connection is taken over once with hijack(). The two are exclusive:
 *
 *   Open --writeResponse()--> ResponseStarted
 *   Open --hijack()---------> Hijacked
 *
 * hijack() from any state but Open fails with already_hijacked or
 * response_started. Until hijacked, the sink owns the socket and closes it
 * on destruction.
 */
class ResponseSink {
public:
    enum class State { Open, ResponseStarted, Hijacked };

    /**
     * @param client_fd Accepted client socket (ownership taken)
     * @param pending Bytes already read from the socket past the request
     */
    explicit ResponseSink(int client_fd, std::string pending = {});
    explicit ResponseSink(std::unique_ptr<Connection> connection);
    ~ResponseSink();

    ResponseSink(const ResponseSink&) = delete;
    ResponseSink& operator=(const ResponseSink&) = delete;

    /** Headers to send with whichever response goes out, hijacked or not */
    HTTPHeaders& headers() { return response_headers; }

    /**
     * Take the raw connection
     *
     * @param ec Set to already_hijacked or response_started on failure
     * @return The connection, or nullptr on failure
     */
    std::unique_ptr<Connection> hijack(std::error_code& ec);

    /**
     * Write a complete response with a text body through the normal path
     *
     * Adds Content-Type, Content-Length and Connection: close.
     *
     * @return false if the sink was hijacked, already responded, or the write failed
     */
    bool writeResponse(int status_code, const std::string& body);

    State state() const { return current; }

private:
    std::unique_ptr<Connection> connection;
    HTTPHeaders response_headers;
    State current = State::Open;
};

#endif // RESPONSE_SINK_HPP

#ifndef RELAY_HPP
#define RELAY_HPP

#include "BufferSource.hpp"
#include "Connection.hpp"

#include <functional>
#include <system_error>
#include <thread>
#include <utility>

/**
 * Relay - Bidirectional byte copying between two connections
 */
class Relay {
public:
    /** Starts the worker thread for one relay direction; may throw std::system_error */
    using Launcher = std::function<std::thread(std::function<void()>)>;

    /** Launcher that starts a plain std::thread */
    static std::thread startThread(std::function<void()> task);

    /**
     * Copy a -> b and b -> a concurrently until both directions finish
     *
     * a -> b runs on a worker thread using bufAtoB, b -> a on the calling
     * thread using bufBtoA. When a source reaches end-of-stream the
     * destination is half-closed; when a direction fails both connections
     * are interrupted so the other direction returns as well.
     *
     * If the worker cannot be started nothing is copied and the launch
     * error is returned for both directions.
     *
     * @return {error a -> b, error b -> a}; empty on clean end-of-stream
     */
    static std::pair<std::error_code, std::error_code> bidiCopy(Connection& a,
                                                                Connection& b,
                                                                Buffer& bufAtoB,
                                                                Buffer& bufBtoA,
                                                                const Launcher& launch = startThread);

    /**
     * Copy src -> dst until end-of-stream or error
     *
     * @param copied Incremented by every byte written to dst
     * @return Empty on clean end-of-stream
     */
    static std::error_code copy(Connection& dst, Connection& src, Buffer& buf, size_t& copied);

private:
    Relay() = delete;
};

#endif // RELAY_HPP

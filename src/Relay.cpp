#include "Relay.hpp"

#include <thread>

std::thread Relay::startThread(std::function<void()> task) {
    return std::thread(std::move(task));
}

std::error_code Relay::copy(Connection& dst, Connection& src, Buffer& buf, size_t& copied) {
    while (true) {
        std::error_code ec;
        size_t n = src.read(buf.data(), buf.size(), ec);
        if (n > 0) {
            std::error_code write_ec;
            size_t written = dst.write(buf.data(), n, write_ec);
            copied += written;
            if (write_ec) {
                return write_ec;
            }
        }
        if (ec) {
            return ec;
        }
        if (n == 0) {
            return {};  // end-of-stream
        }
    }
}

std::pair<std::error_code, std::error_code> Relay::bidiCopy(Connection& a,
                                                            Connection& b,
                                                            Buffer& bufAtoB,
                                                            Buffer& bufBtoA,
                                                            const Launcher& launch) {
    auto runDirection = [&a, &b](Connection& dst, Connection& src, Buffer& buf) {
        size_t copied = 0;
        std::error_code ec = copy(dst, src, buf, copied);
        if (ec) {
            a.interrupt();
            b.interrupt();
        } else {
            dst.closeWrite();
        }
        return ec;
    };

    std::error_code a_to_b;
    std::thread worker;
    try {
        worker = launch([&] { a_to_b = runDirection(b, a, bufAtoB); });
    } catch (const std::system_error& e) {
        return {e.code(), e.code()};
    }
    std::error_code b_to_a = runDirection(a, b, bufBtoA);
    worker.join();

    return {a_to_b, b_to_a};
}

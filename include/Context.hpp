#ifndef CONTEXT_HPP
#define CONTEXT_HPP

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

/**
 * Context - Deadline and cancellation for a single request
 *
 * Copies share the same cancellation flag, so canceling any copy cancels
 * all of them. Only the dial phase observes a Context; once bytes are being
 * relayed, a tunnel ends by closing one of its connections.
 */
class Context {
public:
    using Clock = std::chrono::steady_clock;

    /** A context that never expires and is canceled only explicitly */
    static Context background();

    /** A context whose deadline is now + timeout */
    static Context withTimeout(Clock::duration timeout);

    /** A context expiring at the given instant */
    static Context withDeadline(Clock::time_point deadline);

    void cancel() const;
    bool isCanceled() const;
    bool isExpired() const;

    /** Canceled or expired */
    bool done() const { return isCanceled() || isExpired(); }

    std::optional<Clock::time_point> deadline() const { return deadline_; }

    /**
     * Time left before the deadline, clamped at zero
     *
     * @return nullopt if the context has no deadline
     */
    std::optional<std::chrono::milliseconds> remaining() const;

private:
    Context(std::optional<Clock::time_point> deadline);

    std::optional<Clock::time_point> deadline_;
    std::shared_ptr<std::atomic<bool>> canceled_;
};

#endif // CONTEXT_HPP

#include "Context.hpp"

Context::Context(std::optional<Clock::time_point> deadline)
    : deadline_(deadline), canceled_(std::make_shared<std::atomic<bool>>(false)) {}

Context Context::background() {
    return Context(std::nullopt);
}

Context Context::withTimeout(Clock::duration timeout) {
    return Context(Clock::now() + timeout);
}

Context Context::withDeadline(Clock::time_point deadline) {
    return Context(deadline);
}

void Context::cancel() const {
    canceled_->store(true);
}

bool Context::isCanceled() const {
    return canceled_->load();
}

bool Context::isExpired() const {
    return deadline_ && Clock::now() >= *deadline_;
}

std::optional<std::chrono::milliseconds> Context::remaining() const {
    if (!deadline_) {
        return std::nullopt;
    }
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline_ - Clock::now());
    if (left.count() < 0) {
        return std::chrono::milliseconds{0};
    }
    return left;
}

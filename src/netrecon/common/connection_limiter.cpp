#include "netrecon/common/connection_limiter.h"

#include <algorithm>

namespace netrecon {

ConnectionLimiter::ConnectionLimiter(std::size_t capacity)
    : capacity_(std::max<std::size_t>(1, capacity)) {}

bool ConnectionLimiter::acquire(std::stop_token stop) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait(lock, stop, [this]() { return in_flight_ < capacity_; })) {
        return false;
    }
    if (stop.stop_requested()) {
        return false;
    }
    ++in_flight_;
    peak_ = std::max(peak_, in_flight_);
    return true;
}

bool ConnectionLimiter::try_acquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (in_flight_ >= capacity_) {
        return false;
    }
    ++in_flight_;
    peak_ = std::max(peak_, in_flight_);
    return true;
}

void ConnectionLimiter::release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (in_flight_ > 0) {
            --in_flight_;
        }
    }
    cv_.notify_one();
}

std::size_t ConnectionLimiter::in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_;
}

std::size_t ConnectionLimiter::peak() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peak_;
}

} // namespace netrecon

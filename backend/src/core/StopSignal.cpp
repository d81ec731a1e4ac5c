#include "core/StopSignal.hpp"

namespace capturelink {

void StopSignal::request() {
    {
        std::lock_guard<std::mutex> lk(m_);
        requested_ = true;
    }
    cv_.notify_all();
}

bool StopSignal::requested() const {
    std::lock_guard<std::mutex> lk(m_);
    return requested_;
}

bool StopSignal::wait_for(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lk(m_);
    if (timeout.count() <= 0) return requested_;
    return cv_.wait_for(lk, timeout, [this]() { return requested_; });
}

} // namespace capturelink

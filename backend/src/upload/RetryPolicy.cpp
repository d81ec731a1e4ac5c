#include "upload/RetryPolicy.hpp"

#include "core/ErrorCatalog.hpp"
#include "core/PipelineConfig.hpp"
#include "core/StopSignal.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace capturelink {

RetryPolicy::RetryPolicy(int max_consecutive_failures,
                         std::chrono::milliseconds delay,
                         double backoff,
                         std::chrono::milliseconds max_delay,
                         const StopSignal* cancel)
: max_failures_(max_consecutive_failures), delay_(delay), backoff_(backoff), max_delay_(max_delay), cancel_(cancel) {
    if (max_failures_ < 1) throw std::invalid_argument("RetryPolicy: max_consecutive_failures must be >= 1");
    if (backoff_ < 1.0) backoff_ = 1.0;
}

RetryPolicy RetryPolicy::from_config(const PipelineConfig& cfg, const StopSignal* cancel) {
    return RetryPolicy(cfg.max_consecutive_failures, cfg.retry_delay, cfg.retry_backoff, cfg.retry_max_delay, cancel);
}

std::chrono::milliseconds RetryPolicy::delay_for(int failures) const {
    if (failures <= 1) return delay_;
    double ms = static_cast<double>(delay_.count()) * std::pow(backoff_, failures - 1);
    if (max_delay_.count() > 0) ms = std::min(ms, static_cast<double>(max_delay_.count()));
    return std::chrono::milliseconds(static_cast<int64_t>(ms));
}

Ack RetryPolicy::run(const std::function<Ack()>& attempt, ErrorKind exhausted_kind, const std::string& what) {
    for (;;) {
        Ack ack = attempt();
        if (ack.outcome != AckOutcome::Retryable) {
            failures_ = 0;
            return ack;
        }

        ++failures_;
        std::cerr << "[RetryPolicy] " << what << " failed (" << failures_ << "/" << max_failures_ << "): "
                  << ack.detail << std::endl;
        if (failures_ >= max_failures_) {
            throw UploadError(exhausted_kind,
                              what + " failed " + std::to_string(failures_) + " times in a row; last: " + ack.detail);
        }

        const auto wait = delay_for(failures_);
        if (cancel_) {
            if (cancel_->wait_for(wait)) throw UploadError(ErrorKind::Cancelled, errors::D3300_BY_REQUEST);
        } else {
            std::this_thread::sleep_for(wait);
        }
    }
}

} // namespace capturelink

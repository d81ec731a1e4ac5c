#pragma once

#include <chrono>
#include <functional>
#include <string>

#include "core/UploadError.hpp"
#include "upload/UploadSession.hpp"

namespace capturelink {

class StopSignal;
struct PipelineConfig;

// Repeats an attempt while it reports AckOutcome::Retryable.
class RetryPolicy {
public:
    RetryPolicy(int max_consecutive_failures,
                std::chrono::milliseconds delay,
                double backoff = 1.0,
                std::chrono::milliseconds max_delay = std::chrono::milliseconds(0),
                const StopSignal* cancel = nullptr);

    static RetryPolicy from_config(const PipelineConfig& cfg, const StopSignal* cancel = nullptr);

    // Returns the first non-retryable Ack (Accepted, Fatal or SessionExpired).
    // Throws UploadError(exhausted_kind) once max_consecutive_failures retryable
    // results have been seen in a row, UploadError(Cancelled) if the cancel
    // signal is raised while waiting between attempts.
    Ack run(const std::function<Ack()>& attempt, ErrorKind exhausted_kind, const std::string& what);

    int consecutive_failures() const { return failures_; }
    int max_consecutive_failures() const { return max_failures_; }
    std::chrono::milliseconds delay_for(int failures) const;
    void reset() { failures_ = 0; }

private:
    int max_failures_;
    std::chrono::milliseconds delay_;
    double backoff_;
    std::chrono::milliseconds max_delay_;
    const StopSignal* cancel_;
    int failures_ = 0;
};

} // namespace capturelink

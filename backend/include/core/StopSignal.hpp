#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace capturelink {

// One-shot cooperative signal. Sleeps taken through wait_for() end early once raised.
class StopSignal {
public:
    void request();
    bool requested() const;

    // Returns true if the signal is (or becomes) raised within `timeout`.
    bool wait_for(std::chrono::milliseconds timeout) const;

private:
    mutable std::mutex m_;
    mutable std::condition_variable cv_;
    bool requested_ = false;
};

} // namespace capturelink

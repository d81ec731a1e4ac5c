#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "core/PipelineConfig.hpp"
#include "core/StopSignal.hpp"
#include "pipeline/EventSink.hpp"

namespace capturelink {

namespace net {
class HttpTransport;
}
class CredentialProvider;
class FinalizationCoordinator;

/**
 * @brief Uploads finished recordings one at a time.
 *
 * Each file goes through the same pipeline as a live recording, with the stop
 * already requested and no drain grace. A failed file is tried again up to
 * queue_max_retries times, waiting queue_retry_delay * attempt in between,
 * then lands in failed() until retry_failed() re-queues it.
 */
class UploadQueue {
public:
    struct Entry {
        std::string path;
        int attempts = 0;
        CompletionEvent last;
    };

    UploadQueue(PipelineConfig config,
                net::HttpTransport& transport,
                CredentialProvider& credentials,
                EventSink* events = nullptr);
    ~UploadQueue();

    UploadQueue(const UploadQueue&) = delete;
    UploadQueue& operator=(const UploadQueue&) = delete;

    // False if the file does not exist or is already pending or uploading.
    bool add(const std::string& path);

    void start();
    // Cancels the running upload and joins the worker. Pending files stay queued.
    void stop();

    // Blocks until nothing is pending or uploading. False on timeout.
    bool wait_idle(std::chrono::milliseconds timeout = std::chrono::milliseconds::max());

    // Moves every failed entry back to pending. Returns how many were moved.
    std::size_t retry_failed();

    std::vector<std::string> pending() const;
    std::vector<Entry> completed() const;
    std::vector<Entry> failed() const;
    bool busy() const;

private:
    void worker_loop();
    CompletionEvent upload_once(const std::string& path);
    bool known(const std::string& path) const;

    PipelineConfig config_;
    net::HttpTransport& transport_;
    CredentialProvider& credentials_;
    EventSink* events_;

    mutable std::mutex m_;
    std::condition_variable cv_;
    std::deque<Entry> pending_;
    std::vector<Entry> completed_;
    std::vector<Entry> failed_;
    std::string current_;
    FinalizationCoordinator* active_ = nullptr;
    bool running_ = false;

    std::unique_ptr<StopSignal> shutdown_;
    std::thread worker_;
};

} // namespace capturelink

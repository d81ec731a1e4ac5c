#include "pipeline/UploadQueue.hpp"

#include "pipeline/FinalizationCoordinator.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>

namespace capturelink {

namespace {

// Forwards per-run events to the queue's optional sink.
class ForwardingSink : public EventSink {
public:
    explicit ForwardingSink(EventSink* target) : target_(target) {}
    void on_state(PipelineState s) override {
        if (target_) target_->on_state(s);
    }
    void on_progress(const ProgressEvent& e) override {
        if (target_) target_->on_progress(e);
    }
    void on_completion(const CompletionEvent& e) override {
        if (target_) target_->on_completion(e);
    }

private:
    EventSink* target_;
};

} // namespace

UploadQueue::UploadQueue(PipelineConfig config,
                         net::HttpTransport& transport,
                         CredentialProvider& credentials,
                         EventSink* events)
: config_(std::move(config)), transport_(transport), credentials_(credentials), events_(events) {
    // Files in the queue are already complete.
    config_.drain_grace = std::chrono::milliseconds(0);
    config_.file_wait_attempts = 1;
}

UploadQueue::~UploadQueue() {
    stop();
}

bool UploadQueue::known(const std::string& path) const {
    if (current_ == path) return true;
    return std::any_of(pending_.begin(), pending_.end(), [&](const Entry& e) { return e.path == path; });
}

bool UploadQueue::add(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        std::cerr << "[UploadQueue] not queued, file not found: " << path << std::endl;
        return false;
    }
    {
        std::lock_guard<std::mutex> lk(m_);
        if (known(path)) {
            std::cout << "[UploadQueue] already queued: " << path << std::endl;
            return false;
        }
        Entry e;
        e.path = path;
        pending_.push_back(std::move(e));
        std::cout << "[UploadQueue] queued " << path << " (" << pending_.size() << " pending)" << std::endl;
    }
    cv_.notify_all();
    return true;
}

void UploadQueue::start() {
    std::lock_guard<std::mutex> lk(m_);
    if (running_) return;
    running_ = true;
    shutdown_ = std::make_unique<StopSignal>();
    worker_ = std::thread([this]() { worker_loop(); });
}

void UploadQueue::stop() {
    {
        std::lock_guard<std::mutex> lk(m_);
        if (!running_) return;
        running_ = false;
        shutdown_->request();
        if (active_) active_->cancel();
    }
    cv_.notify_all();
    if (worker_.joinable()) worker_.join();
}

bool UploadQueue::wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(m_);
    auto idle = [this]() { return pending_.empty() && current_.empty(); };
    if (timeout == std::chrono::milliseconds::max()) {
        cv_.wait(lk, idle);
        return true;
    }
    return cv_.wait_for(lk, timeout, idle);
}

std::size_t UploadQueue::retry_failed() {
    std::size_t moved = 0;
    {
        std::lock_guard<std::mutex> lk(m_);
        for (auto& e : failed_) {
            if (known(e.path)) continue;
            e.attempts = 0;
            pending_.push_back(std::move(e));
            ++moved;
        }
        failed_.clear();
    }
    if (moved) {
        std::cout << "[UploadQueue] re-queued " << moved << " failed upload(s)" << std::endl;
        cv_.notify_all();
    }
    return moved;
}

std::vector<std::string> UploadQueue::pending() const {
    std::lock_guard<std::mutex> lk(m_);
    std::vector<std::string> out;
    for (const auto& e : pending_) out.push_back(e.path);
    return out;
}

std::vector<UploadQueue::Entry> UploadQueue::completed() const {
    std::lock_guard<std::mutex> lk(m_);
    return completed_;
}

std::vector<UploadQueue::Entry> UploadQueue::failed() const {
    std::lock_guard<std::mutex> lk(m_);
    return failed_;
}

bool UploadQueue::busy() const {
    std::lock_guard<std::mutex> lk(m_);
    return !current_.empty();
}

CompletionEvent UploadQueue::upload_once(const std::string& path) {
    ForwardingSink sink(events_);
    FinalizationCoordinator coordinator(config_, transport_, credentials_, sink);
    coordinator.request_stop();
    {
        std::lock_guard<std::mutex> lk(m_);
        active_ = &coordinator;
        if (!running_) coordinator.cancel();
    }
    CompletionEvent ev = coordinator.run(path, std::filesystem::path(path).stem().string());
    {
        std::lock_guard<std::mutex> lk(m_);
        active_ = nullptr;
    }
    return ev;
}

void UploadQueue::worker_loop() {
    for (;;) {
        Entry entry;
        {
            std::unique_lock<std::mutex> lk(m_);
            cv_.wait(lk, [this]() { return !running_ || !pending_.empty(); });
            if (!running_) return;
            entry = std::move(pending_.front());
            pending_.pop_front();
            current_ = entry.path;
        }

        const int max_attempts = std::max(1, config_.queue_max_retries);
        bool requeue = false;
        for (;;) {
            ++entry.attempts;
            std::cout << "[UploadQueue] upload attempt " << entry.attempts << "/" << max_attempts << ": "
                      << entry.path << std::endl;
            entry.last = upload_once(entry.path);

            if (entry.last.success) {
                std::cout << "[UploadQueue] uploaded " << entry.path << std::endl;
                break;
            }
            if (shutdown_->requested()) {
                requeue = true;
                break;
            }
            if (entry.attempts >= max_attempts) {
                std::cerr << "[UploadQueue] giving up on " << entry.path << " after " << entry.attempts
                          << " attempts" << std::endl;
                break;
            }
            const auto delay = config_.queue_retry_delay * entry.attempts;
            std::cerr << "[UploadQueue] attempt " << entry.attempts << " failed, retrying in " << delay.count()
                      << " ms" << std::endl;
            if (shutdown_->wait_for(delay)) {
                requeue = true;
                break;
            }
        }

        {
            std::lock_guard<std::mutex> lk(m_);
            if (requeue) {
                entry.attempts = 0;
                pending_.push_front(std::move(entry));
            } else if (entry.last.success) {
                completed_.push_back(std::move(entry));
            } else {
                failed_.push_back(std::move(entry));
            }
            current_.clear();
        }
        cv_.notify_all();
    }
}

} // namespace capturelink

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "core/PipelineConfig.hpp"
#include "core/StopSignal.hpp"
#include "pipeline/EventSink.hpp"
#include "pipeline/PipelineState.hpp"
#include "upload/RetryPolicy.hpp"
#include "upload/UploadSession.hpp"

namespace capturelink {

namespace net {
class HttpTransport;
}
class CredentialProvider;
class GrowthMonitor;

/**
 * @brief Drives one recording from "recording started" to a single terminal event.
 *
 * Idle -> Recording -> Draining -> Finalizing -> Completed, or -> Failed from
 * any non-terminal state. The upload session, the monitor and the offset are
 * confined to the thread executing run(); request_stop() and cancel() may be
 * called from any thread. A coordinator runs exactly once.
 */
class FinalizationCoordinator {
public:
    FinalizationCoordinator(PipelineConfig config,
                            net::HttpTransport& transport,
                            CredentialProvider& credentials,
                            EventSink& sink);
    ~FinalizationCoordinator();

    FinalizationCoordinator(const FinalizationCoordinator&) = delete;
    FinalizationCoordinator& operator=(const FinalizationCoordinator&) = delete;

    // Runs the pipeline on a worker thread.
    void start(const std::string& path, const std::string& name);

    // Runs the pipeline on the calling thread and returns the terminal event.
    CompletionEvent run(const std::string& path, const std::string& name);

    // Recording is over: drain, finalize, clean up. Observed between polls.
    void request_stop();

    // Abort: ends Failed/Cancelled, the local file is kept.
    void cancel();

    // Joins the worker started by start() and returns its terminal event.
    CompletionEvent wait();

    PipelineState state() const { return state_.load(); }
    std::uint64_t bytes_uploaded() const { return bytes_uploaded_.load(); }
    int session_restarts() const { return session_restarts_.load(); }

private:
    CompletionEvent execute(const std::string& path, const std::string& name);
    void transition(PipelineState next);
    void check_cancel() const;
    void start_session(const std::string& name);
    bool upload_pending(GrowthMonitor& monitor, const std::string& name);
    void recover_session(GrowthMonitor& monitor, const std::string& name, const std::string& reason);
    void finalize_upload(GrowthMonitor& monitor, const std::string& name);
    void cleanup(CompletionEvent& ev) const;
    void fail(CompletionEvent& ev, std::optional<ErrorKind> kind, const std::string& message);

    PipelineConfig config_;
    net::HttpTransport& transport_;
    CredentialProvider& credentials_;
    EventSink& sink_;

    StopSignal stop_;
    StopSignal cancel_;
    RetryPolicy chunk_retry_;
    RetryPolicy start_retry_;
    std::unique_ptr<UploadSession> session_;

    std::atomic<PipelineState> state_{PipelineState::Idle};
    std::atomic<std::uint64_t> bytes_uploaded_{0};
    std::atomic<bool> started_{false};
    std::atomic<int> session_restarts_{0};

    std::thread worker_;
    std::mutex result_m_;
    CompletionEvent result_;
};

} // namespace capturelink

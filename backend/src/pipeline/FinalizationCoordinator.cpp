#include "pipeline/FinalizationCoordinator.hpp"

#include "core/ErrorCatalog.hpp"
#include "core/UploadError.hpp"
#include "monitor/GrowthMonitor.hpp"
#include "net/HttpTransport.hpp"
#include "upload/CredentialProvider.hpp"

#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace capturelink {

FinalizationCoordinator::FinalizationCoordinator(PipelineConfig config,
                                                 net::HttpTransport& transport,
                                                 CredentialProvider& credentials,
                                                 EventSink& sink)
: config_(std::move(config)),
  transport_(transport),
  credentials_(credentials),
  sink_(sink),
  chunk_retry_(RetryPolicy::from_config(config_, &cancel_)),
  start_retry_(config_.session_start_attempts, config_.retry_delay, config_.retry_backoff,
               config_.retry_max_delay, &cancel_) {}

FinalizationCoordinator::~FinalizationCoordinator() {
    if (worker_.joinable()) {
        cancel();
        worker_.join();
    }
}

void FinalizationCoordinator::start(const std::string& path, const std::string& name) {
    bool expected = false;
    if (!started_.compare_exchange_strong(expected, true))
        throw std::logic_error("FinalizationCoordinator: already started");
    worker_ = std::thread([this, path, name]() {
        CompletionEvent ev = execute(path, name);
        std::lock_guard<std::mutex> lk(result_m_);
        result_ = std::move(ev);
    });
}

CompletionEvent FinalizationCoordinator::run(const std::string& path, const std::string& name) {
    bool expected = false;
    if (!started_.compare_exchange_strong(expected, true))
        throw std::logic_error("FinalizationCoordinator: already started");
    return execute(path, name);
}

void FinalizationCoordinator::request_stop() {
    stop_.request();
}

void FinalizationCoordinator::cancel() {
    cancel_.request();
    stop_.request(); // wake the poll loop
}

CompletionEvent FinalizationCoordinator::wait() {
    if (worker_.joinable()) worker_.join();
    std::lock_guard<std::mutex> lk(result_m_);
    return result_;
}

void FinalizationCoordinator::transition(PipelineState next) {
    const PipelineState current = state_.load();
    if (is_terminal(current))
        throw std::logic_error(std::string("FinalizationCoordinator: no transition out of ") + to_string(current));
    if (next != PipelineState::Failed && static_cast<int>(next) != static_cast<int>(current) + 1)
        throw std::logic_error(std::string("FinalizationCoordinator: illegal transition ") + to_string(current) +
                               " -> " + to_string(next));
    state_.store(next);
    std::cout << "[Coordinator] state: " << to_string(current) << " -> " << to_string(next) << std::endl;
    sink_.on_state(next);
}

void FinalizationCoordinator::check_cancel() const {
    if (cancel_.requested()) throw UploadError(ErrorKind::Cancelled, errors::D3300_BY_REQUEST);
}

CompletionEvent FinalizationCoordinator::execute(const std::string& path, const std::string& name) {
    CompletionEvent ev;
    ev.path = path;
    session_ = std::make_unique<UploadSession>(transport_, credentials_, config_);

    try {
        GrowthMonitor monitor(path, config_.chunk_size);
        transition(PipelineState::Recording);
        std::cout << "[Coordinator] streaming " << path << " (chunk " << config_.chunk_size / 1024 << " KB, poll "
                  << config_.poll_interval.count() << " ms)" << std::endl;

        start_session(name);
        ev.object_name = session_->object_name();
        monitor.wait_for_creation(config_.file_wait_attempts, config_.file_wait_interval, &cancel_);

        while (!stop_.wait_for(config_.poll_interval)) {
            check_cancel();
            upload_pending(monitor, name);
        }
        check_cancel();

        transition(PipelineState::Draining);
        // Let the recorder flush its trailer before the last reading.
        if (cancel_.wait_for(config_.drain_grace)) throw UploadError(ErrorKind::Cancelled, errors::D3300_BY_REQUEST);
        if (!monitor.exists()) throw UploadError(ErrorKind::ArtifactMissing, errors::D3120_BEFORE_DRAIN);

        transition(PipelineState::Finalizing);
        while (upload_pending(monitor, name)) {
            check_cancel();
        }
        finalize_upload(monitor, name);

        transition(PipelineState::Completed);
        ev.success = true;
        ev.bytes_uploaded = session_->uploaded_offset();
        ev.object_name = session_->object_name();
        ev.remote_id = session_->remote_id();
        std::cout << "[Coordinator] upload complete: " << ev.bytes_uploaded << " bytes as " << ev.object_name
                  << std::endl;
        cleanup(ev);
    } catch (const UploadError& e) {
        fail(ev, e.kind(), e.what());
    } catch (const std::exception& e) {
        fail(ev, std::nullopt, e.what());
    }

    if (session_ && ev.object_name.empty()) ev.object_name = session_->object_name();
    session_.reset();
    sink_.on_completion(ev);
    return ev;
}

void FinalizationCoordinator::start_session(const std::string& name) {
    Ack ack = start_retry_.run([&]() { return session_->start(name); }, ErrorKind::SessionStartError, "session start");
    if (ack.outcome != AckOutcome::Accepted) throw UploadError(ErrorKind::SessionStartError, ack.detail);
    bytes_uploaded_ = 0;
    std::cout << "[Coordinator] upload session started for " << session_->object_name() << std::endl;
}

bool FinalizationCoordinator::upload_pending(GrowthMonitor& monitor, const std::string& name) {
    std::vector<ChunkRange> ranges = monitor.poll();
    if (ranges.empty()) return false;

    for (ChunkRange& range : ranges) {
        check_cancel();
        monitor.load(range);
        const std::string what = "chunk @" + std::to_string(range.offset);
        Ack ack = chunk_retry_.run([&]() { return session_->upload_chunk(range.offset, range.bytes); },
                                   ErrorKind::TooManyRetries, what);
        if (ack.outcome == AckOutcome::SessionExpired) {
            recover_session(monitor, name, ack.detail);
            return true;
        }
        if (ack.outcome != AckOutcome::Accepted) throw UploadError(ErrorKind::ChunkUploadError, ack.detail);

        monitor.confirm(range);
        std::vector<char>().swap(range.bytes);
        bytes_uploaded_ = session_->uploaded_offset();
        sink_.on_progress({state_.load(), bytes_uploaded_.load(), monitor.last_reading()});
    }
    return true;
}

void FinalizationCoordinator::recover_session(GrowthMonitor& monitor, const std::string& name,
                                              const std::string& reason) {
    if (++session_restarts_ > config_.max_session_restarts) {
        throw UploadError(ErrorKind::ChunkUploadError,
                          std::string(errors::D3210_SESSION_EXPIRED_REPEATEDLY) + "; last: " + reason);
    }
    std::cerr << "[Coordinator] upload session expired (" << reason << "); restart " << session_restarts_ << "/"
              << config_.max_session_restarts << ", re-uploading from offset 0" << std::endl;

    chunk_retry_.reset();
    Ack ack = start_retry_.run([&]() { return session_->restart(name); }, ErrorKind::SessionStartError,
                               "session restart");
    if (ack.outcome != AckOutcome::Accepted) throw UploadError(ErrorKind::SessionStartError, ack.detail);
    monitor.rewind();
    bytes_uploaded_ = 0;
}

void FinalizationCoordinator::finalize_upload(GrowthMonitor& monitor, const std::string& name) {
    for (;;) {
        const std::uint64_t total = monitor.observed_size();
        if (session_->uploaded_offset() != total) {
            throw UploadError(ErrorKind::FinalizeError,
                              std::string(errors::D3230_UNACKED_BYTES) + " (acked " +
                                  std::to_string(session_->uploaded_offset()) + ", file " + std::to_string(total) +
                                  ")");
        }
        std::cout << "[Coordinator] finalizing upload with total size " << total << std::endl;

        Ack ack = chunk_retry_.run([&]() { return session_->finalize(total); }, ErrorKind::FinalizeError, "finalize");
        if (ack.outcome == AckOutcome::Accepted) return;
        if (ack.outcome != AckOutcome::SessionExpired) throw UploadError(ErrorKind::FinalizeError, ack.detail);

        recover_session(monitor, name, ack.detail);
        while (upload_pending(monitor, name)) {
            check_cancel();
        }
    }
}

void FinalizationCoordinator::cleanup(CompletionEvent& ev) const {
    if (!config_.delete_on_success) {
        std::cout << "[Coordinator] keeping local file " << ev.path << std::endl;
        return;
    }
    std::error_code ec;
    std::filesystem::remove(ev.path, ec);
    if (ec) {
        std::cerr << "[Coordinator] warning: could not delete " << ev.path << ": " << ec.message() << std::endl;
        return;
    }
    ev.artifact_deleted = true;
    std::cout << "[Coordinator] deleted local file " << ev.path << std::endl;
}

void FinalizationCoordinator::fail(CompletionEvent& ev, std::optional<ErrorKind> kind, const std::string& message) {
    ev.success = false;
    ev.error = message;
    ev.error_kind = kind;
    ev.bytes_uploaded = bytes_uploaded_.load();
    ev.artifact_deleted = false;
    std::cerr << "[Coordinator] upload failed: " << message << "; keeping local file " << ev.path << std::endl;
    if (!is_terminal(state_.load())) {
        state_.store(PipelineState::Failed);
        sink_.on_state(PipelineState::Failed);
    }
}

} // namespace capturelink

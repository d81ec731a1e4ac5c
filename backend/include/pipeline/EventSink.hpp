#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "core/UploadError.hpp"
#include "pipeline/PipelineState.hpp"

namespace capturelink {

struct ProgressEvent {
    PipelineState state = PipelineState::Idle;
    std::uint64_t bytes_uploaded = 0;
    std::uint64_t observed_size = 0;  // last size read from the recording
};

// Exactly one per pipeline run.
struct CompletionEvent {
    bool success = false;
    std::uint64_t bytes_uploaded = 0;
    std::optional<std::string> error;
    std::optional<ErrorKind> error_kind;
    std::string path;
    std::string object_name;
    std::string remote_id;
    bool artifact_deleted = false;
};

nlohmann::json to_json(const ProgressEvent& e);
nlohmann::json to_json(const CompletionEvent& e);

// Compact text form for consoles and sockets. Invalid UTF-8 (for example in a
// path) is replaced instead of throwing.
std::string to_wire(const nlohmann::json& msg);

/**
 * @brief Receiver of pipeline events (UI layer, queue, tests).
 *
 * Called on the pipeline worker thread; implementations must not block for long.
 */
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void on_state(PipelineState) {}
    virtual void on_progress(const ProgressEvent&) {}
    virtual void on_completion(const CompletionEvent& e) = 0;
};

// Typed handlers registered at construction; unset handlers are skipped.
class CallbackEventSink : public EventSink {
public:
    struct Handlers {
        std::function<void(PipelineState)> on_state;
        std::function<void(const ProgressEvent&)> on_progress;
        std::function<void(const CompletionEvent&)> on_completion;
    };

    explicit CallbackEventSink(Handlers handlers) : handlers_(std::move(handlers)) {}

    void on_state(PipelineState s) override {
        if (handlers_.on_state) handlers_.on_state(s);
    }
    void on_progress(const ProgressEvent& e) override {
        if (handlers_.on_progress) handlers_.on_progress(e);
    }
    void on_completion(const CompletionEvent& e) override {
        if (handlers_.on_completion) handlers_.on_completion(e);
    }

private:
    Handlers handlers_;
};

} // namespace capturelink

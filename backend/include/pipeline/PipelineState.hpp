#pragma once

namespace capturelink {

// Declared in transition order; only Failed may be entered out of order.
enum class PipelineState {
    Idle,
    Recording,
    Draining,
    Finalizing,
    Completed,
    Failed
};

inline const char* to_string(PipelineState s) {
    switch (s) {
        case PipelineState::Idle: return "idle";
        case PipelineState::Recording: return "recording";
        case PipelineState::Draining: return "draining";
        case PipelineState::Finalizing: return "finalizing";
        case PipelineState::Completed: return "completed";
        case PipelineState::Failed: return "failed";
    }
    return "unknown";
}

inline bool is_terminal(PipelineState s) {
    return s == PipelineState::Completed || s == PipelineState::Failed;
}

} // namespace capturelink

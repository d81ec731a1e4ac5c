#include "pipeline/EventSink.hpp"

using json = nlohmann::json;

namespace capturelink {

json to_json(const ProgressEvent& e) {
    return {
        {"type", "upload_progress"},
        {"state", to_string(e.state)},
        {"bytes_uploaded", e.bytes_uploaded},
        {"observed_size", e.observed_size}
    };
}

json to_json(const CompletionEvent& e) {
    json out = {
        {"type", "upload_complete"},
        {"success", e.success},
        {"bytes_uploaded", e.bytes_uploaded},
        {"path", e.path},
        {"object_name", e.object_name},
        {"artifact_deleted", e.artifact_deleted}
    };
    if (!e.remote_id.empty()) out["remote_id"] = e.remote_id;
    if (e.error) out["error"] = *e.error;
    if (e.error_kind) {
        out["error_kind"] = to_string(*e.error_kind);
        out["error_code"] = error_code(*e.error_kind);
    }
    return out;
}

std::string to_wire(const json& msg) {
    return msg.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace capturelink

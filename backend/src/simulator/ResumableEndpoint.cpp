#include "simulator/ResumableEndpoint.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <functional>

using json = nlohmann::json;

namespace capturelink::sim {

namespace {

constexpr const char* kInitiatePath = "/upload/files";
constexpr const char* kSessionPrefix = "/upload/session/";

struct ParsedRange {
    bool has_data = false;   // "bytes s-e/..." vs "bytes */T"
    std::uint64_t first = 0;
    std::uint64_t last = 0;
    std::optional<std::uint64_t> total;
};

// "bytes 0-99/*", "bytes 0-99/100", "bytes */100"
std::optional<ParsedRange> parse_content_range(const std::string& value) {
    const std::string prefix = "bytes ";
    if (value.compare(0, prefix.size(), prefix) != 0) return std::nullopt;
    const std::string range_spec = value.substr(prefix.size());
    const auto slash = range_spec.find('/');
    if (slash == std::string::npos) return std::nullopt;

    ParsedRange out;
    try {
        const std::string range = range_spec.substr(0, slash);
        const std::string total = range_spec.substr(slash + 1);
        if (total != "*") out.total = std::stoull(total);
        if (range != "*") {
            const auto dash = range.find('-');
            if (dash == std::string::npos) return std::nullopt;
            out.first = std::stoull(range.substr(0, dash));
            out.last = std::stoull(range.substr(dash + 1));
            if (out.last < out.first) return std::nullopt;
            out.has_data = true;
        }
    } catch (const std::exception&) {
        return std::nullopt;
    }
    return out;
}

EndpointResponse error_response(int status, const std::string& message) {
    EndpointResponse res;
    res.status = status;
    res.body = json{{"error", {{"code", status}, {"message", message}}}}.dump();
    return res;
}

} // namespace

ResumableEndpoint::ResumableEndpoint(std::string base_url) : base_url_(std::move(base_url)) {}

void ResumableEndpoint::set_base_url(const std::string& base_url) {
    std::lock_guard<std::mutex> lk(m_);
    base_url_ = base_url;
}

std::string ResumableEndpoint::initiate_url() const {
    std::lock_guard<std::mutex> lk(m_);
    return base_url_ + kInitiatePath + "?uploadType=resumable";
}

void ResumableEndpoint::set_token(const std::string& token) {
    std::lock_guard<std::mutex> lk(m_);
    token_ = token;
}

void ResumableEndpoint::fail_next_chunks(int count, int status) {
    std::lock_guard<std::mutex> lk(m_);
    fail_chunks_ = count;
    fail_chunk_status_ = status;
}

void ResumableEndpoint::fail_next_starts(int count, int status) {
    std::lock_guard<std::mutex> lk(m_);
    fail_starts_ = count;
    fail_start_status_ = status;
}

void ResumableEndpoint::fail_next_finalizes(int count, int status) {
    std::lock_guard<std::mutex> lk(m_);
    fail_finalizes_ = count;
    fail_finalize_status_ = status;
}

void ResumableEndpoint::expire_sessions() {
    std::lock_guard<std::mutex> lk(m_);
    for (auto& kv : uploads_) kv.second.expired = true;
}

void ResumableEndpoint::expire_on_next_chunk() {
    std::lock_guard<std::mutex> lk(m_);
    expire_on_next_chunk_ = true;
}

void ResumableEndpoint::truncate_next_chunk(std::uint64_t keep) {
    std::lock_guard<std::mutex> lk(m_);
    truncate_keep_ = keep;
}

std::vector<ChunkRecord> ResumableEndpoint::chunk_log() const {
    std::lock_guard<std::mutex> lk(m_);
    return chunk_log_;
}

std::optional<StoredObject> ResumableEndpoint::object(const std::string& name) const {
    std::lock_guard<std::mutex> lk(m_);
    // Latest session wins when a name was restarted.
    std::optional<StoredObject> found;
    int best = 0;
    for (const auto& kv : uploads_) {
        if (kv.second.object.name != name) continue;
        const int n = std::stoi(kv.first);
        if (!found || n > best) {
            found = kv.second.object;
            best = n;
        }
    }
    return found;
}

std::vector<StoredObject> ResumableEndpoint::completed_objects() const {
    std::lock_guard<std::mutex> lk(m_);
    std::vector<StoredObject> out;
    for (const auto& kv : uploads_) {
        if (kv.second.object.complete) out.push_back(kv.second.object);
    }
    return out;
}

int ResumableEndpoint::sessions_started() const {
    std::lock_guard<std::mutex> lk(m_);
    return next_session_ - 1;
}

int ResumableEndpoint::finalize_requests() const {
    std::lock_guard<std::mutex> lk(m_);
    return finalize_requests_;
}

std::string ResumableEndpoint::persisted_range(const Upload& up) {
    if (up.object.data.empty()) return {};
    return "bytes=0-" + std::to_string(up.object.data.size() - 1);
}

EndpointResponse ResumableEndpoint::handle(const EndpointRequest& req) {
    std::lock_guard<std::mutex> lk(m_);

    const std::string bearer = "Bearer ";
    if (req.authorization.compare(0, bearer.size(), bearer) != 0 || req.authorization.size() == bearer.size()) {
        return error_response(401, "missing bearer token");
    }
    if (!token_.empty() && req.authorization != bearer + token_) {
        return error_response(401, "invalid credentials");
    }

    if (req.method == "POST" && req.target.compare(0, std::string(kInitiatePath).size(), kInitiatePath) == 0) {
        return start_session(req);
    }
    const std::string prefix = kSessionPrefix;
    if (req.method == "PUT" && req.target.compare(0, prefix.size(), prefix) == 0) {
        return put(req.target.substr(prefix.size()), req);
    }
    return error_response(400, "unsupported request " + req.method + " " + req.target);
}

EndpointResponse ResumableEndpoint::start_session(const EndpointRequest& req) {
    if (fail_starts_ > 0) {
        --fail_starts_;
        return error_response(fail_start_status_, "injected session start failure");
    }

    json meta;
    try {
        meta = json::parse(req.body);
    } catch (const json::exception&) {
        return error_response(400, "invalid metadata JSON");
    }
    if (!meta.is_object() || !meta.contains("name") || !meta["name"].is_string()) {
        return error_response(400, "metadata must carry a name");
    }

    const std::string id = std::to_string(next_session_++);
    Upload up;
    up.object.name = meta["name"].get<std::string>();
    up.object.mime_type = meta.value("mimeType", std::string());
    uploads_[id] = std::move(up);

    EndpointResponse res;
    res.status = 200;
    res.location = base_url_ + kSessionPrefix + id;
    return res;
}

EndpointResponse ResumableEndpoint::complete(Upload& up) {
    up.object.complete = true;
    if (up.object.id.empty()) up.object.id = "obj-" + std::to_string(std::hash<std::string>{}(up.object.name) % 1000000);
    EndpointResponse res;
    res.status = 200;
    res.body = json{{"id", up.object.id}, {"name", up.object.name}, {"size", up.object.data.size()}}.dump();
    return res;
}

EndpointResponse ResumableEndpoint::put(const std::string& id, const EndpointRequest& req) {
    auto it = uploads_.find(id);
    if (it == uploads_.end()) return error_response(404, "no such upload session");
    Upload& up = it->second;

    const auto range = parse_content_range(req.content_range);
    if (!range) return error_response(400, "malformed Content-Range: " + req.content_range);

    if (!range->has_data) {
        ++finalize_requests_;
        if (up.expired) return error_response(404, "upload session expired");
        if (fail_finalizes_ > 0) {
            --fail_finalizes_;
            return error_response(fail_finalize_status_, "injected finalize failure");
        }
        if (up.object.complete) return complete(up);
        const std::uint64_t stored = up.object.data.size();
        if (range->total && *range->total == stored) return complete(up);
        if (range->total && *range->total < stored) return error_response(400, "declared total below stored size");
        EndpointResponse res;
        res.status = 308;
        res.range = persisted_range(up);
        return res;
    }

    ChunkRecord rec;
    rec.session = id;
    rec.first = range->first;
    rec.last = range->last;

    auto record = [&](EndpointResponse res) {
        rec.status = res.status;
        chunk_log_.push_back(rec);
        return res;
    };

    if (expire_on_next_chunk_) {
        expire_on_next_chunk_ = false;
        up.expired = true;
    }
    if (up.expired) return record(error_response(404, "upload session expired"));
    if (fail_chunks_ > 0) {
        --fail_chunks_;
        return record(error_response(fail_chunk_status_, "injected chunk failure"));
    }
    if (up.object.complete) return record(error_response(400, "upload already complete"));

    const std::uint64_t length = range->last - range->first + 1;
    if (req.body.size() != length) return record(error_response(400, "body length does not match Content-Range"));

    const std::uint64_t stored = up.object.data.size();
    if (range->first > stored) return record(error_response(400, "non-contiguous range"));

    // Resent overlap is dropped; only bytes past the stored end are appended.
    const std::uint64_t skip = stored - range->first;
    if (skip < length) {
        std::uint64_t take = length - skip;
        if (truncate_keep_) {
            take = std::min(take, *truncate_keep_);
            truncate_keep_.reset();
        }
        up.object.data.append(req.body, static_cast<std::size_t>(skip), static_cast<std::size_t>(take));
    }

    if (range->total && *range->total == up.object.data.size()) return record(complete(up));

    EndpointResponse res;
    res.status = 308;
    res.range = persisted_range(up);
    return record(res);
}

} // namespace capturelink::sim

#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace capturelink::sim {

struct EndpointRequest {
    std::string method;        // "POST" or "PUT"
    std::string target;        // path and query, e.g. "/upload/session/3"
    std::string authorization; // full header value
    std::string content_range;
    std::string body;
};

struct EndpointResponse {
    int status = 500;
    std::string location; // set on session creation
    std::string range;    // "bytes=0-N" on 308, empty when nothing is stored
    std::string body;
};

// One PUT carrying data, as the endpoint saw it.
struct ChunkRecord {
    std::string session;
    std::uint64_t first = 0;
    std::uint64_t last = 0;
    int status = 0;
};

struct StoredObject {
    std::string name;
    std::string mime_type;
    std::string data;
    bool complete = false;
    std::string id;
};

/**
 * @brief Server side of the resumable upload protocol, without any transport.
 *
 * Keeps one object per session, appends contiguous ranges, trims resent
 * overlap, completes on a final request declaring the stored total and answers 308 with
 * the persisted Range in between. Fault injection hooks let tests script
 * transient errors, expired sessions and short writes. Thread-safe.
 */
class ResumableEndpoint {
public:
    explicit ResumableEndpoint(std::string base_url = "http://127.0.0.1");

    void set_base_url(const std::string& base_url);
    std::string initiate_url() const;

    // Requests must carry "Bearer <token>". Empty accepts any non-empty bearer.
    void set_token(const std::string& token);

    EndpointResponse handle(const EndpointRequest& req);

    void fail_next_chunks(int count, int status = 503);
    void fail_next_starts(int count, int status = 503);
    void fail_next_finalizes(int count, int status = 503);
    // Every session created so far answers 404 from now on.
    void expire_sessions();
    // The next data PUT expires its session before it is processed.
    void expire_on_next_chunk();
    // The next data PUT persists only `keep` of its new bytes.
    void truncate_next_chunk(std::uint64_t keep);

    std::vector<ChunkRecord> chunk_log() const;
    std::optional<StoredObject> object(const std::string& name) const;
    std::vector<StoredObject> completed_objects() const;
    int sessions_started() const;
    int finalize_requests() const;

private:
    struct Upload {
        StoredObject object;
        bool expired = false;
    };

    EndpointResponse start_session(const EndpointRequest& req);
    EndpointResponse put(const std::string& id, const EndpointRequest& req);
    EndpointResponse complete(Upload& up);
    static std::string persisted_range(const Upload& up);

    mutable std::mutex m_;
    std::string base_url_;
    std::string token_;
    std::map<std::string, Upload> uploads_;
    std::vector<ChunkRecord> chunk_log_;
    int next_session_ = 1;
    int finalize_requests_ = 0;

    int fail_chunks_ = 0;
    int fail_chunk_status_ = 503;
    int fail_starts_ = 0;
    int fail_start_status_ = 503;
    int fail_finalizes_ = 0;
    int fail_finalize_status_ = 503;
    bool expire_on_next_chunk_ = false;
    std::optional<std::uint64_t> truncate_keep_;
};

} // namespace capturelink::sim

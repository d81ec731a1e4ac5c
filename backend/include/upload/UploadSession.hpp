#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "core/PipelineConfig.hpp"

namespace capturelink {

namespace net {
class HttpTransport;
}
class CredentialProvider;

enum class AckOutcome {
    Accepted,       // request acknowledged
    Retryable,      // same request may succeed later
    Fatal,          // stop the pipeline
    SessionExpired  // remote session is gone; start a new one before retrying
};

const char* to_string(AckOutcome outcome);

struct Ack {
    AckOutcome outcome = AckOutcome::Fatal;
    long http_status = 0;
    std::string detail;
};

/**
 * @brief One resumable upload against a remote session endpoint.
 *
 * Chunks must be sent strictly in order: upload_chunk() only accepts the range
 * starting at uploaded_offset(), and uploaded_offset() only moves on an
 * acknowledged chunk. Not thread-safe; owned by the pipeline worker.
 */
class UploadSession {
public:
    UploadSession(net::HttpTransport& transport, CredentialProvider& credentials, PipelineConfig config);

    // POSTs the object metadata to the initiate URL and keeps the returned
    // Location as the session endpoint. Resets the offset to zero.
    Ack start(const std::string& name);

    // Forgets the current endpoint and starts a new session.
    Ack restart(const std::string& name);

    // PUT with "Content-Range: bytes <offset>-<offset+len-1>/*".
    Ack upload_chunk(std::uint64_t offset, const std::vector<char>& bytes);

    // PUT with an empty body and "Content-Range: bytes */<total>". Throws
    // std::logic_error if total_size < uploaded_offset(). After a successful
    // finalize, later calls return the first acknowledgement without a request.
    Ack finalize(std::uint64_t total_size);

    void discard();

    bool active() const { return !endpoint_.empty(); }
    bool finalized() const { return finalized_; }
    const std::string& endpoint() const { return endpoint_; }
    const std::string& object_name() const { return object_name_; }
    const std::string& remote_id() const { return remote_id_; }
    std::uint64_t uploaded_offset() const { return uploaded_offset_; }
    std::chrono::system_clock::time_point started_at() const { return started_at_; }

    static std::string content_range(std::uint64_t offset, std::uint64_t length);
    static std::string final_content_range(std::uint64_t total_size);
    static std::string timestamped_name(const std::string& base, const std::string& extension,
                                        std::chrono::system_clock::time_point when);

private:
    std::vector<std::string> base_headers(const std::string& token) const;
    Ack classify_failure(long status, const std::string& transport_error, const std::string& body) const;

    net::HttpTransport& transport_;
    CredentialProvider& credentials_;
    PipelineConfig config_;

    std::string endpoint_;
    std::string object_name_;
    std::string remote_id_;
    std::uint64_t uploaded_offset_ = 0;
    std::chrono::system_clock::time_point started_at_{};
    bool finalized_ = false;
    Ack finalize_ack_;
};

} // namespace capturelink

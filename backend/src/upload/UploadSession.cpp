#include "upload/UploadSession.hpp"

#include "core/ErrorCatalog.hpp"
#include "net/HttpTransport.hpp"
#include "upload/CredentialProvider.hpp"

#include <nlohmann/json.hpp>

#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace capturelink {

namespace {

std::string body_snippet(const std::string& body) {
    constexpr size_t kMax = 200;
    return errors::printable_detail(body, kMax);
}

// "bytes=0-524287" -> 524288 (one past the last persisted byte). -1 if malformed.
int64_t persisted_end(const std::string& range) {
    auto dash = range.rfind('-');
    if (dash == std::string::npos || dash + 1 >= range.size()) return -1;
    try {
        return static_cast<int64_t>(std::stoull(range.substr(dash + 1))) + 1;
    } catch (const std::exception&) {
        return -1;
    }
}

} // namespace

const char* to_string(AckOutcome outcome) {
    switch (outcome) {
        case AckOutcome::Accepted: return "accepted";
        case AckOutcome::Retryable: return "retryable";
        case AckOutcome::Fatal: return "fatal";
        case AckOutcome::SessionExpired: return "session_expired";
    }
    return "unknown";
}

UploadSession::UploadSession(net::HttpTransport& transport, CredentialProvider& credentials, PipelineConfig config)
: transport_(transport), credentials_(credentials), config_(std::move(config)) {}

std::string UploadSession::content_range(std::uint64_t offset, std::uint64_t length) {
    return "bytes " + std::to_string(offset) + "-" + std::to_string(offset + length - 1) + "/*";
}

std::string UploadSession::final_content_range(std::uint64_t total_size) {
    return "bytes */" + std::to_string(total_size);
}

std::string UploadSession::timestamped_name(const std::string& base, const std::string& extension,
                                            std::chrono::system_clock::time_point when) {
    std::time_t tt = std::chrono::system_clock::to_time_t(when);
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &tt);
#else
    gmtime_r(&tt, &tm);
#endif
    // ISO-8601 with ':' replaced so the name is filesystem-safe.
    std::ostringstream ts;
    ts << std::put_time(&tm, "%Y-%m-%dT%H-%M-%SZ");
    return base + "_" + ts.str() + extension;
}

std::vector<std::string> UploadSession::base_headers(const std::string& token) const {
    return {"Authorization: Bearer " + token};
}

Ack UploadSession::classify_failure(long status, const std::string& transport_error, const std::string& body) const {
    if (status == 0) return {AckOutcome::Retryable, 0, "transport: " + transport_error};

    const std::string detail = "HTTP " + std::to_string(status) + ": " + body_snippet(body);
    if (status == 401 || status == 403) return {AckOutcome::Fatal, status, detail};
    if (status == 404 || status == 410) return {AckOutcome::SessionExpired, status, detail};
    if (status == 408 || status == 429 || status >= 500) return {AckOutcome::Retryable, status, detail};
    return {AckOutcome::Fatal, status, detail};
}

void UploadSession::discard() {
    endpoint_.clear();
    remote_id_.clear();
    uploaded_offset_ = 0;
    finalized_ = false;
    finalize_ack_ = Ack{};
}

Ack UploadSession::start(const std::string& name) {
    discard();
    if (config_.initiate_url.empty()) return {AckOutcome::Fatal, 0, errors::D3200_NO_INITIATE_URL};

    const std::string token = credentials_.bearer_token();
    if (token.empty()) return {AckOutcome::Fatal, 0, errors::D3200_NOT_AUTHENTICATED};

    const auto now = std::chrono::system_clock::now();
    const std::string full_name = timestamped_name(name, config_.file_extension, now);
    json metadata = {
        {"name", full_name},
        {"mimeType", config_.mime_type}
    };

    net::HttpRequest req;
    req.method = "POST";
    req.url = config_.initiate_url;
    req.headers = base_headers(token);
    req.headers.push_back("Content-Type: application/json; charset=UTF-8");
    req.headers.push_back("X-Upload-Content-Type: " + config_.mime_type);
    req.body = metadata.dump();
    req.timeout_ms = config_.request_timeout_ms;

    net::HttpResponse res = transport_.perform(req);
    if (res.status == 200 || res.status == 201) {
        const std::string location = res.header("location");
        if (location.empty()) return {AckOutcome::Fatal, res.status, errors::D3200_MISSING_LOCATION};

        endpoint_ = location;
        object_name_ = full_name;
        started_at_ = now;
        std::cout << "[UploadSession] session created: " << full_name << std::endl;
        return {AckOutcome::Accepted, res.status, location};
    }

    Ack ack = classify_failure(res.status, res.transport_error, res.body);
    if (res.status == 401 || res.status == 403) {
        ack.detail = std::string(errors::D3200_AUTH_REJECTED) + " (" + ack.detail + ")";
    }
    // There is no session yet that could have expired.
    if (ack.outcome == AckOutcome::SessionExpired) ack.outcome = AckOutcome::Fatal;
    std::cerr << "[UploadSession] session start failed (" << to_string(ack.outcome) << "): " << ack.detail << std::endl;
    return ack;
}

Ack UploadSession::restart(const std::string& name) {
    std::cout << "[UploadSession] discarding session " << object_name_ << " at offset " << uploaded_offset_ << std::endl;
    discard();
    return start(name);
}

Ack UploadSession::upload_chunk(std::uint64_t offset, const std::vector<char>& bytes) {
    if (!active()) return {AckOutcome::Fatal, 0, errors::D3210_NO_SESSION};
    if (finalized_) return {AckOutcome::Fatal, 0, "session already finalized"};
    if (offset != uploaded_offset_) {
        return {AckOutcome::Fatal, 0,
                std::string(errors::D3210_OFFSET_MISMATCH) + " (chunk at " + std::to_string(offset) +
                    ", uploaded " + std::to_string(uploaded_offset_) + ")"};
    }
    if (bytes.empty()) return {AckOutcome::Accepted, 0, "empty chunk"};

    const std::string token = credentials_.bearer_token();
    if (token.empty()) return {AckOutcome::Fatal, 0, errors::D3200_NOT_AUTHENTICATED};

    const std::uint64_t length = bytes.size();
    net::HttpRequest req;
    req.method = "PUT";
    req.url = endpoint_;
    req.headers = base_headers(token);
    req.headers.push_back("Content-Type: " + config_.mime_type);
    req.headers.push_back("Content-Range: " + content_range(offset, length));
    req.body.assign(bytes.begin(), bytes.end());
    req.timeout_ms = config_.request_timeout_ms;

    net::HttpResponse res = transport_.perform(req);

    // 308 Resume Incomplete: chunk stored, more expected.
    if (res.status == 308) {
        const std::uint64_t expected_end = offset + length;
        const std::string range = res.header("range");
        if (!range.empty()) {
            const int64_t end = persisted_end(range);
            if (end < 0) return {AckOutcome::Fatal, res.status, "malformed Range header: " + range};
            if (static_cast<std::uint64_t>(end) < expected_end) {
                return {AckOutcome::Retryable, res.status,
                        "server persisted " + std::to_string(end) + " of " + std::to_string(expected_end) + " bytes"};
            }
            if (static_cast<std::uint64_t>(end) > expected_end) {
                return {AckOutcome::Fatal, res.status, errors::D3210_OVER_ACK};
            }
        }
        uploaded_offset_ = expected_end;
        return {AckOutcome::Accepted, res.status, {}};
    }

    if (res.status == 200 || res.status == 201) {
        return {AckOutcome::Fatal, res.status, errors::D3210_PREMATURE_COMPLETE};
    }

    return classify_failure(res.status, res.transport_error, res.body);
}

Ack UploadSession::finalize(std::uint64_t total_size) {
    if (finalized_) return finalize_ack_;
    if (total_size < uploaded_offset_) {
        throw std::logic_error("UploadSession::finalize: total " + std::to_string(total_size) +
                               " is below uploaded offset " + std::to_string(uploaded_offset_));
    }
    if (!active()) return {AckOutcome::Fatal, 0, errors::D3210_NO_SESSION};
    if (total_size > uploaded_offset_) {
        return {AckOutcome::Fatal, 0,
                std::string(errors::D3230_UNACKED_BYTES) + " (total " + std::to_string(total_size) +
                    ", uploaded " + std::to_string(uploaded_offset_) + ")"};
    }

    const std::string token = credentials_.bearer_token();
    if (token.empty()) return {AckOutcome::Fatal, 0, errors::D3200_NOT_AUTHENTICATED};

    net::HttpRequest req;
    req.method = "PUT";
    req.url = endpoint_;
    req.headers = base_headers(token);
    req.headers.push_back("Content-Type: " + config_.mime_type);
    req.headers.push_back("Content-Range: " + final_content_range(total_size));
    req.timeout_ms = config_.request_timeout_ms;

    net::HttpResponse res = transport_.perform(req);
    if (res.status == 200 || res.status == 201) {
        json body = json::parse(res.body, nullptr, false);
        if (body.is_object()) remote_id_ = body.value("id", std::string{});
        finalized_ = true;
        finalize_ack_ = {AckOutcome::Accepted, res.status, remote_id_};
        std::cout << "[UploadSession] upload finalized: " << object_name_ << " (" << total_size << " bytes"
                  << (remote_id_.empty() ? "" : ", id " + remote_id_) << ")" << std::endl;
        return finalize_ack_;
    }

    if (res.status == 308) {
        return {AckOutcome::Fatal, res.status,
                std::string(errors::D3230_INCOMPLETE) + " (Range: " + res.header("range") + ")"};
    }

    return classify_failure(res.status, res.transport_error, res.body);
}

} // namespace capturelink

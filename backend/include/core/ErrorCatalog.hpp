#pragma once

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>

namespace capturelink::errors {

// Numbered error catalog. Completion events carry one of these messages plus a
// detail string; text taken from the network goes through printable_detail().
// 3100-3199: local artifact (recording file) errors
// 3200-3299: remote upload session errors
// 3300-3399: pipeline control errors

inline constexpr int E3100_FILE_CREATION_TIMEOUT = 3100;
inline constexpr int E3110_SIZE_REGRESSION = 3110;
inline constexpr int E3120_ARTIFACT_MISSING = 3120;
inline constexpr int E3200_SESSION_START = 3200;
inline constexpr int E3210_CHUNK_UPLOAD = 3210;
inline constexpr int E3220_TOO_MANY_RETRIES = 3220;
inline constexpr int E3230_FINALIZE = 3230;
inline constexpr int E3300_CANCELLED = 3300;

inline constexpr const char* MSG_E3100_FILE_CREATION_TIMEOUT = "Error 3100: Recording file was never created";
inline constexpr const char* MSG_E3110_SIZE_REGRESSION = "Error 3110: Recording file shrank (corruption)";
inline constexpr const char* MSG_E3120_ARTIFACT_MISSING = "Error 3120: Recording file disappeared";
inline constexpr const char* MSG_E3200_SESSION_START = "Error 3200: Upload session could not be started";
inline constexpr const char* MSG_E3210_CHUNK_UPLOAD = "Error 3210: Chunk upload rejected";
inline constexpr const char* MSG_E3220_TOO_MANY_RETRIES = "Error 3220: Too many consecutive upload failures";
inline constexpr const char* MSG_E3230_FINALIZE = "Error 3230: Upload finalization failed";
inline constexpr const char* MSG_E3300_CANCELLED = "Error 3300: Upload cancelled";

// Detail strings.
inline constexpr const char* D3100_NOT_CREATED = "file did not appear within the wait window";
inline constexpr const char* D3110_SHORT_READ = "read returned fewer bytes than the file reported";
inline constexpr const char* D3120_BEFORE_DRAIN = "recording file not found before finalization";
inline constexpr const char* D3120_OPEN_FAILED = "failed to open recording file for reading";
inline constexpr const char* D3200_NOT_AUTHENTICATED = "no bearer token available";
inline constexpr const char* D3200_AUTH_REJECTED = "credentials rejected by upload endpoint";
inline constexpr const char* D3200_MISSING_LOCATION = "session response carried no Location header";
inline constexpr const char* D3200_NO_INITIATE_URL = "no initiate_url configured";
inline constexpr const char* D3210_NO_SESSION = "no active upload session";
inline constexpr const char* D3210_OFFSET_MISMATCH = "chunk offset does not match uploaded offset";
inline constexpr const char* D3210_PREMATURE_COMPLETE = "server completed the object before finalize";
inline constexpr const char* D3210_OVER_ACK = "server acknowledged more bytes than were sent";
inline constexpr const char* D3210_SESSION_EXPIRED_REPEATEDLY = "upload session expired too many times";
inline constexpr const char* D3230_UNACKED_BYTES = "finalize requested with unacknowledged bytes";
inline constexpr const char* D3230_INCOMPLETE = "server reports the object is still incomplete";
inline constexpr const char* D3300_BY_REQUEST = "cancel requested";

// Cuts text to at most max_bytes without splitting a UTF-8 sequence and replaces
// every byte that is not part of a well-formed sequence with '?'.
inline std::string printable_detail(std::string_view text, std::size_t max_bytes) {
    std::string out;
    out.reserve(std::min(text.size(), max_bytes) + 3);
    std::size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<unsigned char>(text[i]);
        std::size_t len = 0;
        if (lead < 0x80) len = 1;
        else if (lead >= 0xC2 && lead <= 0xDF) len = 2;
        else if (lead >= 0xE0 && lead <= 0xEF) len = 3;
        else if (lead >= 0xF0 && lead <= 0xF4) len = 4;

        bool valid = len != 0 && i + len <= text.size();
        for (std::size_t k = 1; valid && k < len; ++k) {
            const auto c = static_cast<unsigned char>(text[i + k]);
            if ((c & 0xC0) != 0x80) valid = false;
        }
        if (valid && len >= 3) {
            // Overlong forms, surrogates and code points past U+10FFFF.
            const auto second = static_cast<unsigned char>(text[i + 1]);
            if ((lead == 0xE0 && second < 0xA0) || (lead == 0xED && second > 0x9F) ||
                (lead == 0xF0 && second < 0x90) || (lead == 0xF4 && second > 0x8F))
                valid = false;
        }
        if (!valid) len = 1;

        if (out.size() + (valid ? len : 1) > max_bytes) {
            out.append("...");
            return out;
        }
        if (valid) out.append(text.data() + i, len);
        else out.push_back('?');
        i += len;
    }
    return out;
}

inline std::string format_error(const char* message, std::string_view detail) {
    std::string out;
    out.reserve(std::char_traits<char>::length(message) + 2 + detail.size());
    out.append(message);
    if (!detail.empty()) {
        out.append(": ");
        out.append(detail.data(), detail.size());
    }
    return out;
}

} // namespace capturelink::errors

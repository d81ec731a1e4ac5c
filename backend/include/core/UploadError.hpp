#pragma once

#include <stdexcept>
#include <string>

namespace capturelink {

enum class ErrorKind {
    FileCreationTimeout,
    SizeRegression,
    ArtifactMissing,
    SessionStartError,
    ChunkUploadError,
    TooManyRetries,
    FinalizeError,
    Cancelled
};

const char* to_string(ErrorKind kind);
int error_code(ErrorKind kind);

/**
 * @brief Terminal pipeline failure.
 *
 * what() is the catalogued message ("Error 3110: ...: <detail>").
 */
class UploadError : public std::runtime_error {
public:
    UploadError(ErrorKind kind, const std::string& detail);

    ErrorKind kind() const { return kind_; }
    const std::string& detail() const { return detail_; }

private:
    ErrorKind kind_;
    std::string detail_;
};

} // namespace capturelink

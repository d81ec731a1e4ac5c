#include "core/UploadError.hpp"

#include "core/ErrorCatalog.hpp"

namespace capturelink {

namespace {

const char* catalog_message(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::FileCreationTimeout: return errors::MSG_E3100_FILE_CREATION_TIMEOUT;
        case ErrorKind::SizeRegression: return errors::MSG_E3110_SIZE_REGRESSION;
        case ErrorKind::ArtifactMissing: return errors::MSG_E3120_ARTIFACT_MISSING;
        case ErrorKind::SessionStartError: return errors::MSG_E3200_SESSION_START;
        case ErrorKind::ChunkUploadError: return errors::MSG_E3210_CHUNK_UPLOAD;
        case ErrorKind::TooManyRetries: return errors::MSG_E3220_TOO_MANY_RETRIES;
        case ErrorKind::FinalizeError: return errors::MSG_E3230_FINALIZE;
        case ErrorKind::Cancelled: return errors::MSG_E3300_CANCELLED;
    }
    return errors::MSG_E3210_CHUNK_UPLOAD;
}

} // namespace

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::FileCreationTimeout: return "FileCreationTimeout";
        case ErrorKind::SizeRegression: return "SizeRegression";
        case ErrorKind::ArtifactMissing: return "ArtifactMissing";
        case ErrorKind::SessionStartError: return "SessionStartError";
        case ErrorKind::ChunkUploadError: return "ChunkUploadError";
        case ErrorKind::TooManyRetries: return "TooManyRetries";
        case ErrorKind::FinalizeError: return "FinalizeError";
        case ErrorKind::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

int error_code(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::FileCreationTimeout: return errors::E3100_FILE_CREATION_TIMEOUT;
        case ErrorKind::SizeRegression: return errors::E3110_SIZE_REGRESSION;
        case ErrorKind::ArtifactMissing: return errors::E3120_ARTIFACT_MISSING;
        case ErrorKind::SessionStartError: return errors::E3200_SESSION_START;
        case ErrorKind::ChunkUploadError: return errors::E3210_CHUNK_UPLOAD;
        case ErrorKind::TooManyRetries: return errors::E3220_TOO_MANY_RETRIES;
        case ErrorKind::FinalizeError: return errors::E3230_FINALIZE;
        case ErrorKind::Cancelled: return errors::E3300_CANCELLED;
    }
    return 0;
}

UploadError::UploadError(ErrorKind kind, const std::string& detail)
: std::runtime_error(errors::format_error(catalog_message(kind), detail)), kind_(kind), detail_(detail) {}

} // namespace capturelink

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace capturelink {

struct PipelineConfig {
    // Local artifact observation
    std::chrono::milliseconds poll_interval{1000};
    std::uint64_t chunk_size = 512 * 1024;
    int file_wait_attempts = 10;
    std::chrono::milliseconds file_wait_interval{100};
    std::chrono::milliseconds drain_grace{500};
    bool delete_on_success = true;

    // Remote session
    std::string initiate_url;
    std::string mime_type = "video/quicktime";
    std::string file_extension = ".mov";
    long request_timeout_ms = 30000;
    int session_start_attempts = 3;
    int max_session_restarts = 3;

    // Chunk retries
    int max_consecutive_failures = 5;
    std::chrono::milliseconds retry_delay{500};
    double retry_backoff = 2.0;
    std::chrono::milliseconds retry_max_delay{8000};

    // Upload queue (finished recordings)
    int queue_max_retries = 3;
    std::chrono::milliseconds queue_retry_delay{5000};
};

// Keys match the JSON config file; missing keys keep the value from `base`.
PipelineConfig config_from_json(const nlohmann::json& j, PipelineConfig base = {});
nlohmann::json to_json(const PipelineConfig& cfg);

// Reads a JSON config file. Throws std::runtime_error if it cannot be opened or parsed.
PipelineConfig load_config_file(const std::string& path, PipelineConfig base = {});

// CAPTURELINK_<KEY> (upper-cased JSON key) overrides, e.g. CAPTURELINK_CHUNK_SIZE=262144.
void apply_env_overrides(PipelineConfig& cfg);

// Throws std::invalid_argument naming the first offending key.
void validate(const PipelineConfig& cfg);

// Decimal byte count from a flag or env var. Signs, blanks and trailing junk are
// rejected with std::invalid_argument naming `what`.
std::uint64_t parse_byte_count(const std::string& raw, const std::string& what);

} // namespace capturelink

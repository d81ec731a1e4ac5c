#include "core/PipelineConfig.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

namespace capturelink {

namespace {

std::chrono::milliseconds ms_value(const json& j, const char* key, std::chrono::milliseconds def) {
    return std::chrono::milliseconds(j.value(key, static_cast<int64_t>(def.count())));
}

std::string env_name(const std::string& key) {
    std::string out = "CAPTURELINK_";
    for (char c : key) out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    return out;
}

json parse_env_value(const std::string& var, const std::string& raw, const json& current) {
    try {
        if (current.is_boolean()) {
            std::string s = raw;
            std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
            if (s == "1" || s == "true" || s == "yes") return true;
            if (s == "0" || s == "false" || s == "no") return false;
            throw std::invalid_argument(raw);
        }
        if (current.is_number_unsigned()) return parse_byte_count(raw, var);
        if (current.is_number_integer()) return static_cast<int64_t>(std::stoll(raw));
        if (current.is_number_float()) return std::stod(raw);
    } catch (const std::exception&) {
        throw std::invalid_argument("config: invalid value for " + var + ": " + raw);
    }
    return raw;
}

} // namespace

PipelineConfig config_from_json(const json& j, PipelineConfig base) {
    if (!j.is_object()) throw std::invalid_argument("config: top level must be an object");

    const json known = to_json(base);
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (!known.contains(it.key())) {
            std::cerr << "[PipelineConfig] ignoring unknown key '" << it.key() << "'" << std::endl;
        }
    }

    try {
        PipelineConfig c = base;
        c.poll_interval = ms_value(j, "poll_interval_ms", base.poll_interval);
        c.chunk_size = j.value("chunk_size", base.chunk_size);
        c.file_wait_attempts = j.value("file_wait_attempts", base.file_wait_attempts);
        c.file_wait_interval = ms_value(j, "file_wait_interval_ms", base.file_wait_interval);
        c.drain_grace = ms_value(j, "drain_grace_ms", base.drain_grace);
        c.delete_on_success = j.value("delete_on_success", base.delete_on_success);

        c.initiate_url = j.value("initiate_url", base.initiate_url);
        c.mime_type = j.value("mime_type", base.mime_type);
        c.file_extension = j.value("file_extension", base.file_extension);
        c.request_timeout_ms = j.value("request_timeout_ms", base.request_timeout_ms);
        c.session_start_attempts = j.value("session_start_attempts", base.session_start_attempts);
        c.max_session_restarts = j.value("max_session_restarts", base.max_session_restarts);

        c.max_consecutive_failures = j.value("max_consecutive_failures", base.max_consecutive_failures);
        c.retry_delay = ms_value(j, "retry_delay_ms", base.retry_delay);
        c.retry_backoff = j.value("retry_backoff", base.retry_backoff);
        c.retry_max_delay = ms_value(j, "retry_max_delay_ms", base.retry_max_delay);

        c.queue_max_retries = j.value("queue_max_retries", base.queue_max_retries);
        c.queue_retry_delay = ms_value(j, "queue_retry_delay_ms", base.queue_retry_delay);
        return c;
    } catch (const json::exception& e) {
        throw std::invalid_argument(std::string("config: ") + e.what());
    }
}

json to_json(const PipelineConfig& c) {
    return {
        {"poll_interval_ms", static_cast<int64_t>(c.poll_interval.count())},
        {"chunk_size", c.chunk_size},
        {"file_wait_attempts", c.file_wait_attempts},
        {"file_wait_interval_ms", static_cast<int64_t>(c.file_wait_interval.count())},
        {"drain_grace_ms", static_cast<int64_t>(c.drain_grace.count())},
        {"delete_on_success", c.delete_on_success},
        {"initiate_url", c.initiate_url},
        {"mime_type", c.mime_type},
        {"file_extension", c.file_extension},
        {"request_timeout_ms", c.request_timeout_ms},
        {"session_start_attempts", c.session_start_attempts},
        {"max_session_restarts", c.max_session_restarts},
        {"max_consecutive_failures", c.max_consecutive_failures},
        {"retry_delay_ms", static_cast<int64_t>(c.retry_delay.count())},
        {"retry_backoff", c.retry_backoff},
        {"retry_max_delay_ms", static_cast<int64_t>(c.retry_max_delay.count())},
        {"queue_max_retries", c.queue_max_retries},
        {"queue_retry_delay_ms", static_cast<int64_t>(c.queue_retry_delay.count())}
    };
}

PipelineConfig load_config_file(const std::string& path, PipelineConfig base) {
    std::ifstream f(path);
    if (!f) throw std::runtime_error("config: unable to open " + path);
    json j = json::parse(f, nullptr, false);
    if (j.is_discarded()) throw std::runtime_error("config: invalid JSON in " + path);
    return config_from_json(j, base);
}

void apply_env_overrides(PipelineConfig& cfg) {
    const json current = to_json(cfg);
    json overrides = json::object();
    for (auto it = current.begin(); it != current.end(); ++it) {
        const std::string var = env_name(it.key());
        const char* env = std::getenv(var.c_str());
        if (!env || !*env) continue;
        overrides[it.key()] = parse_env_value(var, env, it.value());
    }
    if (!overrides.empty()) cfg = config_from_json(overrides, cfg);
}

void validate(const PipelineConfig& c) {
    auto fail = [](const char* key) { throw std::invalid_argument(std::string("config: ") + key + " out of range"); };
    if (c.poll_interval.count() <= 0) fail("poll_interval_ms");
    if (c.chunk_size == 0) fail("chunk_size");
    if (c.file_wait_attempts < 1) fail("file_wait_attempts");
    if (c.file_wait_interval.count() < 0) fail("file_wait_interval_ms");
    if (c.drain_grace.count() < 0) fail("drain_grace_ms");
    if (c.request_timeout_ms <= 0) fail("request_timeout_ms");
    if (c.session_start_attempts < 1) fail("session_start_attempts");
    if (c.max_session_restarts < 0) fail("max_session_restarts");
    if (c.max_consecutive_failures < 1) fail("max_consecutive_failures");
    if (c.retry_delay.count() < 0) fail("retry_delay_ms");
    if (c.retry_backoff < 1.0) fail("retry_backoff");
    if (c.retry_max_delay < c.retry_delay) fail("retry_max_delay_ms");
    if (c.queue_max_retries < 1) fail("queue_max_retries");
    if (c.queue_retry_delay.count() < 0) fail("queue_retry_delay_ms");
}

std::uint64_t parse_byte_count(const std::string& raw, const std::string& what) {
    const bool digits_only = !raw.empty() && std::all_of(raw.begin(), raw.end(), [](unsigned char c) {
        return std::isdigit(c) != 0;
    });
    if (!digits_only) throw std::invalid_argument(what + ": expected a non-negative integer, got '" + raw + "'");
    try {
        return std::stoull(raw);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument(what + ": value out of range: " + raw);
    }
}

} // namespace capturelink

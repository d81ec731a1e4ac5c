#pragma once

#include "core/PipelineConfig.hpp"
#include "net/HttpTransport.hpp"
#include "pipeline/EventSink.hpp"
#include "simulator/RecordingSimulator.hpp"
#include "simulator/ResumableEndpoint.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <deque>
#include <filesystem>
#include <functional>
#include <fstream>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace capturelink::testing {

// Unique scratch directory, removed with everything in it.
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() / ("capturelink_test_" + std::to_string(rd()));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    std::string file(const std::string& name) const { return (path_ / name).string(); }

private:
    std::filesystem::path path_;
};

inline void append_bytes(const std::string& path, std::uint64_t n, std::uint8_t seed = 7) {
    sim::RecordingSimulator::append_pattern(path, n, seed);
}

inline void truncate_to(const std::string& path, std::uint64_t n) {
    std::filesystem::resize_file(path, n);
}

inline std::string read_all(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
}

// Everything short so a whole pipeline run takes milliseconds.
inline PipelineConfig fast_config(const std::string& initiate_url) {
    PipelineConfig c;
    c.initiate_url = initiate_url;
    c.poll_interval = std::chrono::milliseconds(5);
    c.chunk_size = 1024;
    c.file_wait_attempts = 5;
    c.file_wait_interval = std::chrono::milliseconds(5);
    c.drain_grace = std::chrono::milliseconds(0);
    c.request_timeout_ms = 2000;
    c.retry_delay = std::chrono::milliseconds(1);
    c.retry_backoff = 1.0;
    c.retry_max_delay = std::chrono::milliseconds(2);
    c.queue_retry_delay = std::chrono::milliseconds(1);
    return c;
}

// Polls `cond` until it holds or `timeout` runs out.
inline bool eventually(const std::function<bool()>& cond,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (cond()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return cond();
}

inline std::string header_value(const net::HttpRequest& req, const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
    for (const auto& h : req.headers) {
        const auto colon = h.find(':');
        if (colon == std::string::npos) continue;
        std::string key = h.substr(0, colon);
        std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) { return std::tolower(c); });
        if (key != lower) continue;
        std::string value = h.substr(colon + 1);
        const auto first = value.find_first_not_of(' ');
        return first == std::string::npos ? std::string{} : value.substr(first);
    }
    return {};
}

// Replays canned responses in order and records every request.
class ScriptedTransport : public net::HttpTransport {
public:
    void push(long status, std::string body = {}, std::vector<std::pair<std::string, std::string>> headers = {}) {
        net::HttpResponse r;
        r.status = status;
        r.body = std::move(body);
        for (auto& kv : headers) r.headers[kv.first] = kv.second;
        if (status == 0) r.transport_error = "connection reset";
        responses_.push_back(std::move(r));
    }

    net::HttpResponse perform(const net::HttpRequest& req) override {
        requests.push_back(req);
        if (responses_.empty()) {
            net::HttpResponse r;
            r.transport_error = "no scripted response";
            return r;
        }
        net::HttpResponse r = responses_.front();
        responses_.pop_front();
        return r;
    }

    std::vector<net::HttpRequest> requests;

private:
    std::deque<net::HttpResponse> responses_;
};

/**
 * In-process adapter in front of a ResumableEndpoint: no sockets, same
 * protocol. Can also drop requests on the floor (status 0) and run a hook
 * before each request is handled.
 */
class EndpointTransport : public net::HttpTransport {
public:
    explicit EndpointTransport(sim::ResumableEndpoint& endpoint) : endpoint_(endpoint) {}

    void fail_transport_next(int n) { transport_failures_ = n; }
    void set_before_request(std::function<void(const net::HttpRequest&)> hook) { before_ = std::move(hook); }

    net::HttpResponse perform(const net::HttpRequest& req) override {
        {
            std::lock_guard<std::mutex> lk(m_);
            requests_.push_back(req.method + " " + header_value(req, "Content-Range"));
        }
        if (before_) before_(req);

        net::HttpResponse res;
        if (transport_failures_ > 0) {
            --transport_failures_;
            res.transport_error = "simulated connection reset";
            return res;
        }

        sim::EndpointRequest er;
        er.method = req.method;
        er.target = target_of(req.url);
        er.authorization = header_value(req, "Authorization");
        er.content_range = header_value(req, "Content-Range");
        er.body = req.body;

        const sim::EndpointResponse r = endpoint_.handle(er);
        res.status = r.status;
        res.body = r.body;
        if (!r.location.empty()) res.headers["location"] = r.location;
        if (!r.range.empty()) res.headers["range"] = r.range;
        return res;
    }

    std::vector<std::string> requests() const {
        std::lock_guard<std::mutex> lk(m_);
        return requests_;
    }

private:
    static std::string target_of(const std::string& url) {
        const auto scheme = url.find("://");
        const auto slash = url.find('/', scheme == std::string::npos ? 0 : scheme + 3);
        return slash == std::string::npos ? "/" : url.substr(slash);
    }

    sim::ResumableEndpoint& endpoint_;
    std::atomic<int> transport_failures_{0};
    std::function<void(const net::HttpRequest&)> before_;
    mutable std::mutex m_;
    std::vector<std::string> requests_;
};

// Keeps every event it receives.
class RecordingSink : public EventSink {
public:
    void on_state(PipelineState s) override {
        std::lock_guard<std::mutex> lk(m_);
        states_.push_back(s);
    }
    void on_progress(const ProgressEvent& e) override {
        std::lock_guard<std::mutex> lk(m_);
        progress_.push_back(e);
    }
    void on_completion(const CompletionEvent& e) override {
        std::lock_guard<std::mutex> lk(m_);
        completions_.push_back(e);
    }

    std::vector<PipelineState> states() const {
        std::lock_guard<std::mutex> lk(m_);
        return states_;
    }
    std::vector<ProgressEvent> progress() const {
        std::lock_guard<std::mutex> lk(m_);
        return progress_;
    }
    std::vector<CompletionEvent> completions() const {
        std::lock_guard<std::mutex> lk(m_);
        return completions_;
    }

private:
    mutable std::mutex m_;
    std::vector<PipelineState> states_;
    std::vector<ProgressEvent> progress_;
    std::vector<CompletionEvent> completions_;
};

} // namespace capturelink::testing

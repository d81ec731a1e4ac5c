#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <thread>

#include "core/StopSignal.hpp"

namespace capturelink::sim {

/**
 * @brief Stands in for a camera writer: appends a deterministic byte pattern
 * to a file on a fixed schedule.
 *
 * Byte i of the file is (i * 131 + seed) & 0xFF, so any uploaded copy can be
 * checked with expected_bytes() without keeping the data around.
 */
class RecordingSimulator {
public:
    struct Options {
        std::chrono::milliseconds create_delay{0};   // before the file appears
        std::chrono::milliseconds write_interval{50};
        std::uint64_t bytes_per_write = 64 * 1024;
        std::uint64_t max_bytes = 0;                 // 0: until stop()
        std::uint64_t tail_bytes = 0;                // written after stop(), like a trailer
        std::uint8_t seed = 7;
    };

    RecordingSimulator(std::string path, Options options);
    ~RecordingSimulator();

    RecordingSimulator(const RecordingSimulator&) = delete;
    RecordingSimulator& operator=(const RecordingSimulator&) = delete;

    void start();
    // Stops appending, writes the tail and joins the writer thread.
    void stop();

    const std::string& path() const { return path_; }
    std::uint64_t bytes_written() const { return written_.load(); }

    static std::string expected_bytes(std::uint64_t offset, std::uint64_t length, std::uint8_t seed);

    // Appends `length` pattern bytes starting at the current file end.
    static void append_pattern(const std::string& path, std::uint64_t length, std::uint8_t seed);

private:
    void write_loop();

    std::string path_;
    Options options_;
    StopSignal stop_;
    std::atomic<std::uint64_t> written_{0};
    std::thread writer_;
};

} // namespace capturelink::sim

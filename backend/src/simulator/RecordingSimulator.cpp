#include "simulator/RecordingSimulator.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace capturelink::sim {

RecordingSimulator::RecordingSimulator(std::string path, Options options)
: path_(std::move(path)), options_(options) {}

RecordingSimulator::~RecordingSimulator() {
    stop();
}

std::string RecordingSimulator::expected_bytes(std::uint64_t offset, std::uint64_t length, std::uint8_t seed) {
    std::string out;
    out.resize(static_cast<std::size_t>(length));
    for (std::uint64_t i = 0; i < length; ++i) {
        out[static_cast<std::size_t>(i)] = static_cast<char>(((offset + i) * 131 + seed) & 0xFF);
    }
    return out;
}

void RecordingSimulator::append_pattern(const std::string& path, std::uint64_t length, std::uint8_t seed) {
    std::error_code ec;
    const auto existing = std::filesystem::exists(path, ec) ? std::filesystem::file_size(path, ec) : 0;
    std::ofstream out(path, std::ios::binary | std::ios::app);
    if (!out) throw std::runtime_error("RecordingSimulator: cannot open " + path);
    const std::string data = expected_bytes(ec ? 0 : existing, length, seed);
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
    out.flush();
    if (!out) throw std::runtime_error("RecordingSimulator: write failed on " + path);
}

void RecordingSimulator::start() {
    if (writer_.joinable()) return;
    writer_ = std::thread([this]() { write_loop(); });
}

void RecordingSimulator::stop() {
    stop_.request();
    if (writer_.joinable()) writer_.join();
}

void RecordingSimulator::write_loop() {
    try {
        if (options_.create_delay.count() > 0 && stop_.wait_for(options_.create_delay)) return;
        {
            std::ofstream create(path_, std::ios::binary | std::ios::trunc);
            if (!create) throw std::runtime_error("cannot create " + path_);
        }
        std::cout << "[RecordingSimulator] recording to " << path_ << std::endl;

        while (!stop_.requested()) {
            std::uint64_t n = options_.bytes_per_write;
            if (options_.max_bytes > 0) n = std::min(n, options_.max_bytes - written_.load());
            if (n > 0) {
                append_pattern(path_, n, options_.seed);
                written_ += n;
            }
            if (stop_.wait_for(options_.write_interval)) break;
        }

        if (options_.tail_bytes > 0) {
            append_pattern(path_, options_.tail_bytes, options_.seed);
            written_ += options_.tail_bytes;
        }
        std::cout << "[RecordingSimulator] stopped after " << written_.load() << " bytes" << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "[RecordingSimulator] writer error: " << e.what() << std::endl;
    }
}

} // namespace capturelink::sim

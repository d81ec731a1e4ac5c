#include "monitor/GrowthMonitor.hpp"

#include "core/ErrorCatalog.hpp"
#include "core/StopSignal.hpp"
#include "core/UploadError.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace capturelink {

GrowthMonitor::GrowthMonitor(std::string path, std::uint64_t chunk_size)
: chunk_size_(chunk_size) {
    if (chunk_size_ == 0) throw std::invalid_argument("GrowthMonitor: chunk_size must be > 0");
    handle_.path = std::move(path);
}

bool GrowthMonitor::exists() const {
    std::error_code ec;
    return std::filesystem::is_regular_file(handle_.path, ec);
}

void GrowthMonitor::wait_for_creation(int attempts, std::chrono::milliseconds interval, const StopSignal* cancel) {
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        if (exists()) {
            created_ = true;
            std::cout << "[GrowthMonitor] recording file present (attempt " << attempt << "): " << handle_.path << std::endl;
            return;
        }
        if (attempt == attempts) break;
        if (cancel) {
            if (cancel->wait_for(interval)) throw UploadError(ErrorKind::Cancelled, errors::D3300_BY_REQUEST);
        } else {
            std::this_thread::sleep_for(interval);
        }
    }
    std::cerr << "[GrowthMonitor] recording file not created after " << attempts << " checks: " << handle_.path << std::endl;
    throw UploadError(ErrorKind::FileCreationTimeout, errors::D3100_NOT_CREATED);
}

std::vector<ChunkRange> GrowthMonitor::poll() {
    std::vector<ChunkRange> out;

    std::error_code ec;
    const auto size = std::filesystem::file_size(handle_.path, ec);
    if (ec) {
        // Until the file has been seen, a missing file just means "nothing yet".
        if (created_ && !missing_warned_) {
            std::cerr << "[GrowthMonitor] recording file disappeared: " << handle_.path << std::endl;
            missing_warned_ = true;
        }
        return out;
    }
    created_ = true;
    missing_warned_ = false;

    const std::uint64_t current = static_cast<std::uint64_t>(size);
    if (current < high_water_) {
        std::cerr << "[GrowthMonitor] file size decreased! was " << high_water_ << ", now " << current << std::endl;
        throw UploadError(ErrorKind::SizeRegression,
                          "size went from " + std::to_string(high_water_) + " to " + std::to_string(current));
    }
    high_water_ = current;
    last_reading_ = current;

    if (current <= handle_.observed_size) return out;

    for (std::uint64_t pos = handle_.observed_size; pos < current;) {
        ChunkRange r;
        r.offset = pos;
        r.length = std::min<std::uint64_t>(chunk_size_, current - pos);
        pos += r.length;
        out.push_back(std::move(r));
    }
    return out;
}

void GrowthMonitor::load(ChunkRange& range) const {
    std::ifstream f(handle_.path, std::ios::in | std::ios::binary);
    if (!f) throw UploadError(ErrorKind::ArtifactMissing, errors::D3120_OPEN_FAILED);

    range.bytes.resize(static_cast<size_t>(range.length));
    f.seekg(static_cast<std::streamoff>(range.offset));
    f.read(range.bytes.data(), static_cast<std::streamsize>(range.length));
    const auto got = static_cast<std::uint64_t>(f.gcount());
    if (got != range.length) {
        range.bytes.clear();
        throw UploadError(ErrorKind::SizeRegression,
                          std::string(errors::D3110_SHORT_READ) + " (" + std::to_string(got) + " of " +
                              std::to_string(range.length) + " at offset " + std::to_string(range.offset) + ")");
    }
}

void GrowthMonitor::confirm(const ChunkRange& range) {
    if (range.offset != handle_.observed_size) {
        throw std::logic_error("GrowthMonitor::confirm: range at " + std::to_string(range.offset) +
                               " does not start at observed size " + std::to_string(handle_.observed_size));
    }
    handle_.observed_size += range.length;
}

void GrowthMonitor::rewind() {
    handle_.observed_size = 0;
}

} // namespace capturelink

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace capturelink {

class StopSignal;

// Read-only view of the file a recorder is appending to.
struct RecordingHandle {
    std::string path;
    std::uint64_t observed_size = 0; // bytes confirmed uploaded
};

// Contiguous byte range. bytes stay empty until GrowthMonitor::load().
struct ChunkRange {
    std::uint64_t offset = 0;
    std::uint64_t length = 0;
    std::vector<char> bytes;
};

/**
 * @brief Watches a growing recording and cuts new bytes into capped chunks.
 *
 * The monitor never holds the file open between calls: every size check and
 * read goes through a fresh handle so the writer is never blocked.
 * observed_size only moves through confirm(), so an unacknowledged range is
 * handed out again by the next poll().
 */
class GrowthMonitor {
public:
    GrowthMonitor(std::string path, std::uint64_t chunk_size);

    // Blocks until the file exists. Throws UploadError(FileCreationTimeout) after
    // `attempts` checks, UploadError(Cancelled) if `cancel` is raised meanwhile.
    void wait_for_creation(int attempts, std::chrono::milliseconds interval, const StopSignal* cancel = nullptr);

    // Ranges covering [observed_size, current size), each at most chunk_size long.
    // Empty when there is nothing new. Throws UploadError(SizeRegression) if the
    // file is smaller than any earlier reading.
    std::vector<ChunkRange> poll();

    // Fills range.bytes from disk. Throws UploadError(SizeRegression) on a short read.
    void load(ChunkRange& range) const;

    // Marks `range` as uploaded. The range must start at observed_size.
    void confirm(const ChunkRange& range);

    // Starts handing out ranges from offset 0 again (new remote session).
    void rewind();

    bool exists() const;
    bool created() const { return created_; }
    const RecordingHandle& handle() const { return handle_; }
    std::uint64_t observed_size() const { return handle_.observed_size; }
    std::uint64_t last_reading() const { return last_reading_; }
    std::uint64_t chunk_size() const { return chunk_size_; }

private:
    RecordingHandle handle_;
    std::uint64_t chunk_size_;
    std::uint64_t last_reading_ = 0;
    std::uint64_t high_water_ = 0;
    bool created_ = false;
    bool missing_warned_ = false;
};

} // namespace capturelink

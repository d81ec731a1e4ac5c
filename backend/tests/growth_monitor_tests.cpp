#include <gtest/gtest.h>
#include "monitor/GrowthMonitor.hpp"
#include "core/StopSignal.hpp"
#include "core/UploadError.hpp"
#include "test_utils.hpp"

#include <thread>

using namespace capturelink;
using capturelink::testing::TempDir;
using capturelink::testing::append_bytes;
using capturelink::testing::truncate_to;

static void confirm_all(GrowthMonitor& m, const std::vector<ChunkRange>& ranges) {
    for (const auto& r : ranges) m.confirm(r);
}

TEST(GrowthMonitor, RejectsZeroChunkSize) {
    EXPECT_THROW(GrowthMonitor("x", 0), std::invalid_argument);
}

TEST(GrowthMonitor, MissingFileIsNoNewData) {
    TempDir dir;
    GrowthMonitor m(dir.file("rec.mov"), 1024);
    EXPECT_TRUE(m.poll().empty());
    EXPECT_FALSE(m.created());
}

TEST(GrowthMonitor, CreationTimeout) {
    TempDir dir;
    GrowthMonitor m(dir.file("never.mov"), 1024);
    try {
        m.wait_for_creation(3, std::chrono::milliseconds(1));
        FAIL() << "expected FileCreationTimeout";
    } catch (const UploadError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::FileCreationTimeout);
    }
}

TEST(GrowthMonitor, CreationSeenWhileWaiting) {
    TempDir dir;
    const auto path = dir.file("late.mov");
    std::thread writer([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        append_bytes(path, 10);
    });
    GrowthMonitor m(path, 1024);
    EXPECT_NO_THROW(m.wait_for_creation(200, std::chrono::milliseconds(5)));
    writer.join();
    EXPECT_TRUE(m.created());
}

TEST(GrowthMonitor, CancelInterruptsCreationWait) {
    TempDir dir;
    GrowthMonitor m(dir.file("never.mov"), 1024);
    StopSignal cancel;
    cancel.request();
    try {
        m.wait_for_creation(100, std::chrono::milliseconds(1000), &cancel);
        FAIL() << "expected Cancelled";
    } catch (const UploadError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Cancelled);
    }
}

// Two writes between polls are reported together.
TEST(GrowthMonitor, WritesBetweenPollsCoalesce) {
    TempDir dir;
    const auto path = dir.file("a.mov");
    append_bytes(path, 300000);
    append_bytes(path, 300000);
    GrowthMonitor m(path, 1024 * 1024);
    auto ranges = m.poll();
    ASSERT_EQ(ranges.size(), 1u);
    EXPECT_EQ(ranges[0].offset, 0u);
    EXPECT_EQ(ranges[0].length, 600000u);
    m.confirm(ranges[0]);
    EXPECT_EQ(m.observed_size(), 600000u);
}

TEST(GrowthMonitor, LargeDeltaSplitsAtChunkCap) {
    TempDir dir;
    const auto path = dir.file("b.mov");
    append_bytes(path, 1048576);
    GrowthMonitor m(path, 512 * 1024);
    auto ranges = m.poll();
    ASSERT_EQ(ranges.size(), 2u);
    EXPECT_EQ(ranges[0].offset, 0u);
    EXPECT_EQ(ranges[0].length, 524288u);
    EXPECT_EQ(ranges[1].offset, 524288u);
    EXPECT_EQ(ranges[1].length, 524288u);
    EXPECT_TRUE(ranges[0].bytes.empty());
}

TEST(GrowthMonitor, SixHundredThousandBytesAtDefaultCapIsTwoChunks) {
    TempDir dir;
    const auto path = dir.file("c.mov");
    append_bytes(path, 600000);
    GrowthMonitor m(path, 512 * 1024);
    auto ranges = m.poll();
    ASSERT_EQ(ranges.size(), 2u);
    EXPECT_EQ(ranges[1].offset + ranges[1].length, 600000u);
}

TEST(GrowthMonitor, UnconfirmedRangeIsOfferedAgain) {
    TempDir dir;
    const auto path = dir.file("d.mov");
    append_bytes(path, 1000);
    GrowthMonitor m(path, 400);
    auto first = m.poll();
    ASSERT_EQ(first.size(), 3u);
    m.confirm(first[0]);

    auto second = m.poll();
    ASSERT_EQ(second.size(), 2u);
    EXPECT_EQ(second[0].offset, 400u);
    EXPECT_EQ(m.observed_size(), 400u);
}

TEST(GrowthMonitor, LoadReadsExactBytes) {
    TempDir dir;
    const auto path = dir.file("e.mov");
    append_bytes(path, 5000, 3);
    GrowthMonitor m(path, 2048);
    auto ranges = m.poll();
    ASSERT_EQ(ranges.size(), 3u);
    m.load(ranges[1]);
    const auto expected = sim::RecordingSimulator::expected_bytes(2048, 2048, 3);
    ASSERT_EQ(ranges[1].bytes.size(), 2048u);
    EXPECT_EQ(std::string(ranges[1].bytes.begin(), ranges[1].bytes.end()), expected);
}

TEST(GrowthMonitor, ConfirmOutOfOrderIsLogicError) {
    TempDir dir;
    const auto path = dir.file("f.mov");
    append_bytes(path, 2000);
    GrowthMonitor m(path, 1000);
    auto ranges = m.poll();
    ASSERT_EQ(ranges.size(), 2u);
    EXPECT_THROW(m.confirm(ranges[1]), std::logic_error);
}

TEST(GrowthMonitor, ShrinkIsSizeRegression) {
    TempDir dir;
    const auto path = dir.file("g.mov");
    append_bytes(path, 4000);
    GrowthMonitor m(path, 1024);
    confirm_all(m, m.poll());
    truncate_to(path, 1000);
    try {
        m.poll();
        FAIL() << "expected SizeRegression";
    } catch (const UploadError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::SizeRegression);
    }
}

// Shrinking below an earlier reading is caught even if nothing was confirmed.
TEST(GrowthMonitor, ShrinkBelowUnconfirmedReading) {
    TempDir dir;
    const auto path = dir.file("h.mov");
    append_bytes(path, 1000);
    GrowthMonitor m(path, 1024);
    ASSERT_EQ(m.poll().size(), 1u);
    truncate_to(path, 400);
    EXPECT_THROW(m.poll(), UploadError);
}

TEST(GrowthMonitor, ShortReadIsSizeRegression) {
    TempDir dir;
    const auto path = dir.file("i.mov");
    append_bytes(path, 3000);
    GrowthMonitor m(path, 1000);
    auto ranges = m.poll();
    truncate_to(path, 2500);
    try {
        m.load(ranges[2]);
        FAIL() << "expected SizeRegression";
    } catch (const UploadError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::SizeRegression);
    }
}

TEST(GrowthMonitor, DeletedFileOnLoadIsArtifactMissing) {
    TempDir dir;
    const auto path = dir.file("j.mov");
    append_bytes(path, 100);
    GrowthMonitor m(path, 1000);
    auto ranges = m.poll();
    std::filesystem::remove(path);
    try {
        m.load(ranges[0]);
        FAIL() << "expected ArtifactMissing";
    } catch (const UploadError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ArtifactMissing);
    }
    EXPECT_TRUE(m.poll().empty());
}

TEST(GrowthMonitor, RewindStartsFromZero) {
    TempDir dir;
    const auto path = dir.file("k.mov");
    append_bytes(path, 1500);
    GrowthMonitor m(path, 1000);
    confirm_all(m, m.poll());
    EXPECT_EQ(m.observed_size(), 1500u);
    m.rewind();
    EXPECT_EQ(m.observed_size(), 0u);
    auto ranges = m.poll();
    ASSERT_EQ(ranges.size(), 2u);
    EXPECT_EQ(ranges[0].offset, 0u);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}

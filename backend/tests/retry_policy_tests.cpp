#include <gtest/gtest.h>
#include "upload/RetryPolicy.hpp"
#include "core/PipelineConfig.hpp"
#include "core/StopSignal.hpp"

#include <thread>

using namespace capturelink;
using std::chrono::milliseconds;

static Ack retryable() { return {AckOutcome::Retryable, 503, "busy"}; }
static Ack accepted() { return {AckOutcome::Accepted, 308, {}}; }

TEST(RetryPolicy, ThreeFailuresThenSuccessResetsCounter) {
    RetryPolicy policy(5, milliseconds(0));
    int calls = 0;
    Ack ack = policy.run([&]() { return ++calls <= 3 ? retryable() : accepted(); },
                         ErrorKind::TooManyRetries, "chunk");
    EXPECT_EQ(ack.outcome, AckOutcome::Accepted);
    EXPECT_EQ(calls, 4);
    EXPECT_EQ(policy.consecutive_failures(), 0);
}

TEST(RetryPolicy, FiveFailuresIsTooManyRetries) {
    RetryPolicy policy(5, milliseconds(0));
    int calls = 0;
    try {
        policy.run([&]() { ++calls; return retryable(); }, ErrorKind::TooManyRetries, "chunk");
        FAIL() << "expected TooManyRetries";
    } catch (const UploadError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::TooManyRetries);
    }
    EXPECT_EQ(calls, 5);
    EXPECT_EQ(policy.consecutive_failures(), 5);
}

TEST(RetryPolicy, NonRetryableOutcomesReturnImmediately) {
    RetryPolicy policy(5, milliseconds(0));
    int calls = 0;
    Ack fatal = policy.run([&]() { ++calls; return Ack{AckOutcome::Fatal, 401, "no"}; },
                           ErrorKind::TooManyRetries, "chunk");
    EXPECT_EQ(fatal.outcome, AckOutcome::Fatal);
    Ack expired = policy.run([&]() { ++calls; return Ack{AckOutcome::SessionExpired, 404, "gone"}; },
                             ErrorKind::TooManyRetries, "chunk");
    EXPECT_EQ(expired.outcome, AckOutcome::SessionExpired);
    EXPECT_EQ(calls, 2);
}

// Failures on one range do not count against the next one.
TEST(RetryPolicy, CounterIsPerOutstandingAttempt) {
    RetryPolicy policy(3, milliseconds(0));
    int calls = 0;
    policy.run([&]() { return ++calls <= 2 ? retryable() : accepted(); }, ErrorKind::TooManyRetries, "first");
    calls = 0;
    Ack ack = policy.run([&]() { return ++calls <= 2 ? retryable() : accepted(); }, ErrorKind::TooManyRetries,
                         "second");
    EXPECT_EQ(ack.outcome, AckOutcome::Accepted);
}

TEST(RetryPolicy, ExhaustedKindIsCallerChosen) {
    RetryPolicy policy(1, milliseconds(0));
    try {
        policy.run(retryable, ErrorKind::SessionStartError, "session start");
        FAIL();
    } catch (const UploadError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::SessionStartError);
    }
}

TEST(RetryPolicy, BackoffIsCapped) {
    RetryPolicy policy(10, milliseconds(100), 2.0, milliseconds(350));
    EXPECT_EQ(policy.delay_for(1), milliseconds(100));
    EXPECT_EQ(policy.delay_for(2), milliseconds(200));
    EXPECT_EQ(policy.delay_for(3), milliseconds(350));
    EXPECT_EQ(policy.delay_for(8), milliseconds(350));
}

TEST(RetryPolicy, ConstantDelayWithoutBackoff) {
    RetryPolicy policy(10, milliseconds(40));
    EXPECT_EQ(policy.delay_for(1), milliseconds(40));
    EXPECT_EQ(policy.delay_for(6), milliseconds(40));
}

TEST(RetryPolicy, CancelInterruptsWait) {
    StopSignal cancel;
    RetryPolicy policy(5, milliseconds(10000), 1.0, milliseconds(0), &cancel);
    std::thread canceller([&]() {
        std::this_thread::sleep_for(milliseconds(20));
        cancel.request();
    });
    const auto started = std::chrono::steady_clock::now();
    try {
        policy.run(retryable, ErrorKind::TooManyRetries, "chunk");
        FAIL() << "expected Cancelled";
    } catch (const UploadError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Cancelled);
    }
    canceller.join();
    EXPECT_LT(std::chrono::steady_clock::now() - started, milliseconds(5000));
}

TEST(RetryPolicy, FromConfig) {
    PipelineConfig cfg;
    cfg.max_consecutive_failures = 7;
    RetryPolicy policy = RetryPolicy::from_config(cfg);
    EXPECT_EQ(policy.max_consecutive_failures(), 7);
    EXPECT_EQ(policy.delay_for(1), cfg.retry_delay);
}

TEST(RetryPolicy, RejectsZeroThreshold) {
    EXPECT_THROW(RetryPolicy(0, milliseconds(1)), std::invalid_argument);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}

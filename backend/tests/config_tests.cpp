#include <gtest/gtest.h>
#include "core/PipelineConfig.hpp"
#include "core/ErrorCatalog.hpp"
#include "core/UploadError.hpp"
#include "pipeline/EventSink.hpp"
#include "test_utils.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>

using namespace capturelink;
using nlohmann::json;

TEST(PipelineConfig, Defaults) {
    PipelineConfig c;
    EXPECT_EQ(c.poll_interval, std::chrono::milliseconds(1000));
    EXPECT_EQ(c.chunk_size, 512u * 1024u);
    EXPECT_EQ(c.max_consecutive_failures, 5);
    EXPECT_TRUE(c.delete_on_success);
    EXPECT_EQ(c.queue_max_retries, 3);
    EXPECT_NO_THROW(validate(c));
}

TEST(PipelineConfig, JsonOverridesOnlyGivenKeys) {
    const json j = {{"chunk_size", 262144}, {"poll_interval_ms", 250}, {"initiate_url", "http://h/up"}};
    PipelineConfig c = config_from_json(j);
    EXPECT_EQ(c.chunk_size, 262144u);
    EXPECT_EQ(c.poll_interval, std::chrono::milliseconds(250));
    EXPECT_EQ(c.initiate_url, "http://h/up");
    EXPECT_EQ(c.max_consecutive_failures, 5);
}

TEST(PipelineConfig, WrongTypeIsInvalidArgument) {
    EXPECT_THROW(config_from_json(json{{"chunk_size", "big"}}), std::invalid_argument);
    EXPECT_THROW(config_from_json(json::array()), std::invalid_argument);
}

TEST(PipelineConfig, RoundTripThroughJson) {
    PipelineConfig c;
    c.retry_backoff = 1.5;
    c.mime_type = "video/mp4";
    const PipelineConfig back = config_from_json(to_json(c));
    EXPECT_EQ(back.retry_backoff, 1.5);
    EXPECT_EQ(back.mime_type, "video/mp4");
}

TEST(PipelineConfig, LoadFile) {
    capturelink::testing::TempDir dir;
    const auto path = dir.file("cfg.json");
    {
        std::ofstream f(path);
        f << R"({"max_consecutive_failures": 9, "delete_on_success": false})";
    }
    PipelineConfig c = load_config_file(path);
    EXPECT_EQ(c.max_consecutive_failures, 9);
    EXPECT_FALSE(c.delete_on_success);

    EXPECT_THROW(load_config_file(dir.file("missing.json")), std::runtime_error);
    {
        std::ofstream f(dir.file("bad.json"));
        f << "{not json";
    }
    EXPECT_THROW(load_config_file(dir.file("bad.json")), std::runtime_error);
}

TEST(PipelineConfig, EnvironmentOverrides) {
    ::setenv("CAPTURELINK_CHUNK_SIZE", "4096", 1);
    ::setenv("CAPTURELINK_DELETE_ON_SUCCESS", "no", 1);
    ::setenv("CAPTURELINK_INITIATE_URL", "http://env/up", 1);
    PipelineConfig c;
    apply_env_overrides(c);
    EXPECT_EQ(c.chunk_size, 4096u);
    EXPECT_FALSE(c.delete_on_success);
    EXPECT_EQ(c.initiate_url, "http://env/up");

    ::setenv("CAPTURELINK_CHUNK_SIZE", "lots", 1);
    PipelineConfig d;
    EXPECT_THROW(apply_env_overrides(d), std::invalid_argument);

    ::unsetenv("CAPTURELINK_CHUNK_SIZE");
    ::unsetenv("CAPTURELINK_DELETE_ON_SUCCESS");
    ::unsetenv("CAPTURELINK_INITIATE_URL");
}

TEST(PipelineConfig, ValidateRejectsNonsense) {
    PipelineConfig c;
    c.chunk_size = 0;
    EXPECT_THROW(validate(c), std::invalid_argument);
    c = PipelineConfig{};
    c.poll_interval = std::chrono::milliseconds(0);
    EXPECT_THROW(validate(c), std::invalid_argument);
    c = PipelineConfig{};
    c.retry_backoff = 0.5;
    EXPECT_THROW(validate(c), std::invalid_argument);
}

TEST(ErrorCatalog, MessagesCarryCodes) {
    UploadError e(ErrorKind::TooManyRetries, "chunk @0 failed 5 times");
    EXPECT_EQ(std::string(e.what()).rfind("Error 3220: ", 0), 0u);
    EXPECT_NE(std::string(e.what()).find("chunk @0 failed 5 times"), std::string::npos);
    EXPECT_EQ(error_code(ErrorKind::SizeRegression), errors::E3110_SIZE_REGRESSION);
    EXPECT_EQ(errors::format_error(errors::MSG_E3300_CANCELLED, ""), errors::MSG_E3300_CANCELLED);
}

TEST(EventSink, CompletionJson) {
    CompletionEvent ev;
    ev.success = false;
    ev.bytes_uploaded = 1024;
    ev.error = "Error 3220: Too many consecutive upload failures";
    ev.error_kind = ErrorKind::TooManyRetries;
    const json j = to_json(ev);
    EXPECT_EQ(j["type"], "upload_complete");
    EXPECT_EQ(j["success"], false);
    EXPECT_EQ(j["bytes_uploaded"], 1024);
    EXPECT_EQ(j["error_code"], 3220);
    EXPECT_FALSE(j.contains("remote_id"));

    ProgressEvent p{PipelineState::Draining, 10, 20};
    EXPECT_EQ(to_json(p)["state"], "draining");
}

TEST(PipelineConfig, ByteCountsRejectSigns) {
    EXPECT_EQ(parse_byte_count("262144", "--chunk-size"), 262144u);
    EXPECT_THROW(parse_byte_count("-1", "--chunk-size"), std::invalid_argument);
    EXPECT_THROW(parse_byte_count("+5", "--chunk-size"), std::invalid_argument);
    EXPECT_THROW(parse_byte_count(" 5", "--chunk-size"), std::invalid_argument);
    EXPECT_THROW(parse_byte_count("12k", "--chunk-size"), std::invalid_argument);
    EXPECT_THROW(parse_byte_count("", "--chunk-size"), std::invalid_argument);
    EXPECT_THROW(parse_byte_count("99999999999999999999999", "--chunk-size"), std::invalid_argument);

    ::setenv("CAPTURELINK_CHUNK_SIZE", "-1", 1);
    PipelineConfig c;
    EXPECT_THROW(apply_env_overrides(c), std::invalid_argument);
    EXPECT_EQ(c.chunk_size, PipelineConfig{}.chunk_size);
    ::unsetenv("CAPTURELINK_CHUNK_SIZE");
}

TEST(ErrorCatalog, PrintableDetailKeepsWholeCharacters) {
    EXPECT_EQ(errors::printable_detail("short", 200), "short");
    EXPECT_EQ(errors::printable_detail(std::string(199, 'a') + "\xC3\xA9!", 200), std::string(199, 'a') + "...");
    EXPECT_EQ(errors::printable_detail("caf\xC3\xA9", 200), "caf\xC3\xA9");
    EXPECT_EQ(errors::printable_detail("bad\xFF\xE9 page", 200), "bad?? page");
    EXPECT_EQ(errors::printable_detail("cut\xE2\x82", 200), "cut??");
    EXPECT_EQ(errors::printable_detail("\xC0\xAF", 200), "??");
}

TEST(EventSink, WireFormReplacesInvalidUtf8) {
    CompletionEvent ev;
    ev.path = "/rec/clip\xFF.mov";
    ev.error = std::string("HTTP 500: \xE9t\xE9");
    std::string wire;
    EXPECT_NO_THROW(wire = to_wire(to_json(ev)));
    EXPECT_NE(wire.find("\"type\":\"upload_complete\""), std::string::npos);
    EXPECT_NO_THROW(json::parse(wire));
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}

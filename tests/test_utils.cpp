#include "tinyboard/common.hpp"
#include "tinyboard/error.hpp"
#include "tinyboard/time_utils.hpp"
#include "utils/config.hpp"
#include "crypto/random.hpp"
#include "board/model.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <set>

using namespace tinyboard;

namespace fs = std::filesystem;

// ============================================================================
// Strings
// ============================================================================

TEST(StringTest, Trim) {
    EXPECT_EQ(trim("  a b  "), "a b");
    EXPECT_EQ(trim("\n\t"), "");
    EXPECT_EQ(trim(""), "");
    EXPECT_EQ(trim("x"), "x");

    // Unicode White_Space counts too
    EXPECT_EQ(trim("\xC2\xA0"), "");                        // U+00A0
    EXPECT_EQ(trim("\xE3\x80\x80"), "");                    // U+3000
    EXPECT_EQ(trim("\xE2\x80\x83"), "");                    // U+2003
    EXPECT_EQ(trim("\xE2\x80\x83hi\xC2\x85"), "hi");
    EXPECT_EQ(trim(" \xC3\xA9 "), "\xC3\xA9");             // non-space multibyte kept
    EXPECT_EQ(trim("\xFF "), "\xFF");                        // malformed byte is content
}

TEST(StringTest, Blank) {
    EXPECT_TRUE(is_blank(""));
    EXPECT_TRUE(is_blank(" \r\n"));
    EXPECT_FALSE(is_blank(" . "));
    EXPECT_TRUE(is_blank("\xC2\xA0\xE2\x80\xA8\xE3\x80\x80"));
    EXPECT_FALSE(is_blank("\xC2\xA0x"));
}

TEST(StringTest, Utf8Length) {
    EXPECT_EQ(utf8_length("abc"), 3u);
    EXPECT_EQ(utf8_length("\xC3\xA9t\xC3\xA9"), 3u);          // été
    EXPECT_EQ(utf8_length("\xF0\x9F\x98\x80"), 1u);           // one emoji
    EXPECT_EQ(to_lower("PhOTO.JPG"), "photo.jpg");
}

// ============================================================================
// Result and errors
// ============================================================================

namespace {

Result<int> parse_positive(int value) {
    if (value <= 0) {
        return Error(ErrorCode::InvalidArgument, "not positive");
    }
    return Result<int>::Ok(value);
}

Result<int> doubled(int value) {
    auto parsed = parse_positive(value);
    if (parsed.is_err()) {
        return parsed.error();
    }
    return Result<int>::Ok(parsed.value() * 2);
}

Result<void> checked(int value) {
    TINYBOARD_TRY(parse_positive(value));
    return Result<void>::Ok();
}

} // anonymous namespace

TEST(ResultTest, OkAndErr) {
    auto ok = doubled(21);
    ASSERT_TRUE(ok.is_ok());
    EXPECT_EQ(ok.value(), 42);
    EXPECT_EQ(ok.value_or(0), 42);

    auto err = doubled(-1);
    ASSERT_TRUE(err.is_err());
    EXPECT_EQ(err.error().code(), ErrorCode::InvalidArgument);
    EXPECT_EQ(err.value_or(7), 7);
    EXPECT_FALSE(err.ok().has_value());
    EXPECT_THROW(err.value(), std::runtime_error);
}

TEST(ResultTest, TryPropagates) {
    EXPECT_TRUE(checked(1).is_ok());

    auto failed = checked(0);
    ASSERT_TRUE(failed.is_err());
    EXPECT_EQ(failed.error().message(), "not positive");
    EXPECT_THROW(failed.unwrap(), std::runtime_error);
}

TEST(ResultTest, ClientErrors) {
    EXPECT_TRUE(is_client_error(ErrorCode::ValidationFailed));
    EXPECT_TRUE(is_client_error(ErrorCode::NotFound));
    EXPECT_TRUE(is_client_error(ErrorCode::UnsupportedMediaType));
    EXPECT_TRUE(is_client_error(ErrorCode::InvalidMedia));
    EXPECT_FALSE(is_client_error(ErrorCode::StoreWriteFailed));
    EXPECT_FALSE(is_client_error(ErrorCode::IoError));
}

TEST(ResultTest, ErrorToString) {
    Error error(ErrorCode::StoreCorrupted, "bad block", "checksum mismatch");
    auto text = error.to_string();
    EXPECT_NE(text.find("Store corrupted"), std::string::npos);
    EXPECT_NE(text.find("bad block"), std::string::npos);
    EXPECT_NE(text.find("checksum mismatch"), std::string::npos);
}

// ============================================================================
// Config
// ============================================================================

TEST(ConfigTest, LoadFromJson) {
    auto config = utils::Config::load_from_json(R"({
        "http_port": 9090,
        "log_level": "debug",
        "sync_writes": true
    })");

    EXPECT_EQ(config.get_or<uint16_t>("http_port", 8080), 9090);
    EXPECT_EQ(config.get_or<std::string>("log_level", "info"), "debug");
    EXPECT_TRUE(config.get_or<bool>("sync_writes", false));
    EXPECT_EQ(config.get_or<std::string>("db_path", "board_db"), "board_db");
    EXPECT_TRUE(config.has("http_port"));
    EXPECT_FALSE(config.has("db_path"));
}

TEST(ConfigTest, WrongTypeFallsBackToDefault) {
    auto config = utils::Config::load_from_json(R"({"http_port": "eighty"})");
    EXPECT_FALSE(config.get<uint16_t>("http_port").has_value());
    EXPECT_EQ(config.get_or<uint16_t>("http_port", 8080), 8080);
}

TEST(ConfigTest, MalformedJsonThrows) {
    EXPECT_THROW(utils::Config::load_from_json("{oops"), std::runtime_error);
    EXPECT_THROW(utils::Config::load_from_json("[1, 2]"), std::runtime_error);
    EXPECT_THROW(utils::Config::load_from_file("./no_such_config.json"), std::runtime_error);
}

TEST(ConfigTest, SaveAndReload) {
    const std::string path = "./test_utils_config.json";
    utils::Config config;
    config.set("image_upload_dir", std::string("./up/"));
    config.set("worker_threads", 4);
    config.save_to_file(path);

    auto reloaded = utils::Config::load_from_file(path);
    EXPECT_EQ(reloaded.get_or<std::string>("image_upload_dir", ""), "./up/");
    EXPECT_EQ(reloaded.get_or<size_t>("worker_threads", 8), 4u);

    fs::remove(path);
}

// ============================================================================
// Time and random
// ============================================================================

TEST(TimeTest, TimestampFormatting) {
    EXPECT_EQ(time::to_string(0), "1970-01-01T00:00:00Z");
    EXPECT_EQ(time::to_timestamp(time::from_timestamp(1700000000)), 1700000000);
    EXPECT_GT(time::timestamp_seconds(), 1600000000);
}

TEST(RandomTest, UuidV4Shape) {
    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i) {
        auto id = crypto::Random::uuid_v4();
        ASSERT_EQ(id.size(), 36u);
        EXPECT_EQ(id[8], '-');
        EXPECT_EQ(id[13], '-');
        EXPECT_EQ(id[14], '4');
        EXPECT_EQ(id[18], '-');
        EXPECT_NE(std::string("89ab").find(id[19]), std::string::npos);
        EXPECT_EQ(id[23], '-');
        seen.insert(id);
    }
    EXPECT_EQ(seen.size(), 100u);
}

// ============================================================================
// Record encoding
// ============================================================================

TEST(ModelTest, Keys) {
    EXPECT_EQ(board::thread_key(7), "thread_7");
    EXPECT_EQ(board::reply_key(12, 3), "reply_12_3");
    EXPECT_EQ(board::reply_prefix(1), "reply_1_");
    EXPECT_EQ(board::reply_key(12, 3).rfind(board::reply_prefix(1), 0), std::string::npos);
}

TEST(ModelTest, ThreadRecordFields) {
    board::Thread thread;
    thread.id = 3;
    thread.title = "t";
    thread.message = "m";
    thread.last_updated = 1700000000;

    auto record = board::serialize_thread(thread);
    ASSERT_TRUE(record.is_ok());
    EXPECT_NE(record.value().find("\"media_url\":null"), std::string::npos);
    EXPECT_NE(record.value().find("\"media_kind\":null"), std::string::npos);

    thread.media_url = "/uploads/videos/v.mp4";
    thread.media_kind = board::MediaKind::Video;
    auto with_media = board::serialize_thread(thread).unwrap();
    EXPECT_NE(with_media.find("\"media_kind\":\"Video\""), std::string::npos);

    auto decoded = board::deserialize_thread(with_media);
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_EQ(decoded.value(), thread);
}

TEST(ModelTest, MalformedRecords) {
    EXPECT_EQ(board::deserialize_thread("nope").error().code(), ErrorCode::DeserializationFailed);
    EXPECT_EQ(board::deserialize_thread(R"({"id":1})").error().code(),
              ErrorCode::DeserializationFailed);
    EXPECT_EQ(board::deserialize_thread(
                  R"({"id":1,"title":"t","message":"m","last_updated":1,"media_url":"/x","media_kind":"Audio"})")
                  .error().code(),
              ErrorCode::DeserializationFailed);
    EXPECT_EQ(board::deserialize_reply(R"({"message":"m"})").error().code(),
              ErrorCode::DeserializationFailed);
}

int main(int argc, char** argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}

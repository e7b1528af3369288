#include "osync/sync/config.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace std::chrono_literals;
using osync::ErrorKind;
using osync::sync::ConflictPolicy;
using osync::sync::load_config;
using osync::sync::parse_config;
using osync::sync::SyncConfig;
using osync::version::FeatureId;

namespace {

fs::path write_temp_file(const std::string& content) {
    static std::atomic<uint64_t> counter{0};
    auto path = fs::temp_directory_path() /
                ("osync_config_test_" + std::to_string(::getpid()) + "_" + std::to_string(counter.fetch_add(1)) + ".json");
    std::ofstream out(path);
    out << content;
    return path;
}

} // namespace

TEST(SyncConfigTest, DefaultsAreValid) {
    SyncConfig config;
    EXPECT_TRUE(config.validate().is_ok());
    EXPECT_EQ(config.batch_size, 100u);
    EXPECT_EQ(config.max_retries, 3u);
    EXPECT_EQ(config.backoff_base, 1000ms);
    EXPECT_EQ(config.backoff_cap, 30000ms);
    EXPECT_EQ(config.conflict_policy, ConflictPolicy::LastWriteWins);

    const auto policy = config.retry_policy();
    EXPECT_EQ(policy.base, 1000ms);
    EXPECT_EQ(policy.max_retries, 3u);
}

TEST(SyncConfigTest, ParsesEveryKey) {
    const auto document = nlohmann::json::parse(R"({
        "batch_size": 25,
        "max_retries": 5,
        "backoff_base_ms": 200,
        "backoff_cap_ms": 5000,
        "conflict_policy": "manual",
        "sync_interval_hint_ms": 60000,
        "request_timeout_ms": 1500,
        "session_timeout_ms": 0,
        "collections": ["patients", "visits"],
        "required_features": {"tracker_events": "tracker_api"}
    })");

    auto parsed = parse_config(document);
    ASSERT_TRUE(parsed.is_ok()) << parsed.error().message;
    const auto& config = parsed.value();

    EXPECT_EQ(config.batch_size, 25u);
    EXPECT_EQ(config.max_retries, 5u);
    EXPECT_EQ(config.backoff_base, 200ms);
    EXPECT_EQ(config.backoff_cap, 5000ms);
    EXPECT_EQ(config.conflict_policy, ConflictPolicy::Manual);
    EXPECT_EQ(config.sync_interval_hint, 60000ms);
    EXPECT_EQ(config.request_timeout, 1500ms);
    EXPECT_EQ(config.session_timeout, 0ms);
    ASSERT_EQ(config.collections.size(), 2u);
    EXPECT_EQ(config.collections[1], "visits");
    ASSERT_EQ(config.required_features.count("tracker_events"), 1u);
    EXPECT_EQ(config.required_features.at("tracker_events"), FeatureId::TrackerApi);
}

TEST(SyncConfigTest, RejectsBadSettings) {
    auto unknown_policy = parse_config(nlohmann::json::parse(R"({"conflict_policy": "coin_flip"})"));
    ASSERT_TRUE(unknown_policy.is_error());
    EXPECT_EQ(unknown_policy.error().kind, ErrorKind::InvalidArgument);

    auto unknown_feature = parse_config(nlohmann::json::parse(R"({"required_features": {"x": "warp"}})"));
    ASSERT_TRUE(unknown_feature.is_error());
    EXPECT_EQ(unknown_feature.error().kind, ErrorKind::InvalidArgument);

    auto zero_batch = parse_config(nlohmann::json::parse(R"({"batch_size": 0})"));
    ASSERT_TRUE(zero_batch.is_error());
    EXPECT_EQ(zero_batch.error().kind, ErrorKind::InvalidArgument);

    auto inverted = parse_config(nlohmann::json::parse(R"({"backoff_base_ms": 500, "backoff_cap_ms": 100})"));
    EXPECT_TRUE(inverted.is_error());

    auto duplicate = parse_config(nlohmann::json::parse(R"({"collections": ["a", "a"]})"));
    EXPECT_TRUE(duplicate.is_error());

    auto wrong_type = parse_config(nlohmann::json::parse(R"({"batch_size": "many"})"));
    ASSERT_TRUE(wrong_type.is_error());
    EXPECT_EQ(wrong_type.error().kind, ErrorKind::Parse);

    auto negative_retries = parse_config(nlohmann::json::parse(R"({"max_retries": -1})"));
    ASSERT_TRUE(negative_retries.is_error());
    EXPECT_EQ(negative_retries.error().kind, ErrorKind::InvalidArgument);

    auto negative_batch = parse_config(nlohmann::json::parse(R"({"batch_size": -1})"));
    ASSERT_TRUE(negative_batch.is_error());
    EXPECT_EQ(negative_batch.error().kind, ErrorKind::InvalidArgument);

    auto fractional = parse_config(nlohmann::json::parse(R"({"batch_size": 2.5})"));
    ASSERT_TRUE(fractional.is_error());
    EXPECT_EQ(fractional.error().kind, ErrorKind::InvalidArgument);

    auto too_many_retries = parse_config(nlohmann::json::parse(R"({"max_retries": 5000000000})"));
    ASSERT_TRUE(too_many_retries.is_error());
    EXPECT_EQ(too_many_retries.error().kind, ErrorKind::InvalidArgument);

    auto not_object = parse_config(nlohmann::json::array());
    ASSERT_TRUE(not_object.is_error());
    EXPECT_EQ(not_object.error().kind, ErrorKind::Parse);
}

TEST(SyncConfigTest, LoadsFromFile) {
    const auto path = write_temp_file(R"({"batch_size": 10, "collections": ["patients"]})");

    auto loaded = load_config(path);
    ASSERT_TRUE(loaded.is_ok());
    EXPECT_EQ(loaded.value().batch_size, 10u);
    EXPECT_EQ(loaded.value().collections.size(), 1u);
    fs::remove(path);

    auto missing = load_config(path);
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().kind, ErrorKind::NotFound);

    const auto broken = write_temp_file("{ not json");
    auto garbled = load_config(broken);
    ASSERT_TRUE(garbled.is_error());
    EXPECT_EQ(garbled.error().kind, ErrorKind::Parse);
    fs::remove(broken);
}

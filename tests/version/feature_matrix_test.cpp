#include "osync/version/feature_matrix.hpp"

#include <gtest/gtest.h>

using osync::ErrorKind;
using osync::version::FeatureId;
using osync::version::FeatureMatrix;
using osync::version::RemoteCapability;
using osync::version::RemoteVersion;

namespace {

RemoteCapability capability(std::uint32_t major, std::uint32_t minor, std::uint32_t patch = 0) {
    return RemoteCapability::from_version(RemoteVersion{major, minor, patch}, 0, false);
}

} // namespace

TEST(RemoteVersionTest, ParsesReleaseAndSnapshotForms) {
    auto plain = RemoteVersion::parse("2.40.1");
    ASSERT_TRUE(plain.is_ok());
    EXPECT_EQ(plain.value(), (RemoteVersion{2, 40, 1}));

    auto short_form = RemoteVersion::parse("2.38");
    ASSERT_TRUE(short_form.is_ok());
    EXPECT_EQ(short_form.value(), (RemoteVersion{2, 38, 0}));

    auto snapshot = RemoteVersion::parse("2.41-SNAPSHOT");
    ASSERT_TRUE(snapshot.is_ok());
    EXPECT_EQ(snapshot.value(), (RemoteVersion{2, 41, 0}));

    auto hotfix = RemoteVersion::parse(" 2.38.2.1 ");
    ASSERT_TRUE(hotfix.is_ok());
    EXPECT_EQ(hotfix.value(), (RemoteVersion{2, 38, 2}));
}

TEST(RemoteVersionTest, RejectsMalformedVersions) {
    for (const auto* text : {"", "2", "two.forty", "2.x.1", "v2.40"}) {
        auto parsed = RemoteVersion::parse(text);
        ASSERT_TRUE(parsed.is_error()) << text;
        EXPECT_EQ(parsed.error().kind, ErrorKind::Parse);
    }
}

TEST(RemoteVersionTest, OrdersBySemanticComponents) {
    EXPECT_LT((RemoteVersion{2, 9, 9}), (RemoteVersion{2, 10, 0}));
    EXPECT_LT((RemoteVersion{2, 40, 0}), (RemoteVersion{2, 40, 1}));
    EXPECT_GT((RemoteVersion{3, 0, 0}), (RemoteVersion{2, 99, 99}));
    EXPECT_EQ((RemoteVersion{2, 40, 1}).to_string(), "2.40.1");
}

TEST(FeatureMatrixTest, SupportIsMonotonicAcrossVersions) {
    for (auto feature : FeatureMatrix::all_features()) {
        const auto minimum = FeatureMatrix::minimum_version(feature);
        bool seen = false;
        for (std::uint32_t minor = 30; minor <= 45; ++minor) {
            const bool supported = FeatureMatrix::supports(feature, RemoteVersion{2, minor, 0});
            if (seen) {
                EXPECT_TRUE(supported) << FeatureMatrix::feature_name(feature) << " at 2." << minor;
            }
            seen = seen || supported;
        }
        EXPECT_TRUE(FeatureMatrix::supports(feature, minimum));
        EXPECT_TRUE(FeatureMatrix::supports(feature, RemoteVersion{3, 0, 0}));
    }
}

TEST(FeatureMatrixTest, GatesFeaturesAtTheirMinimumRelease) {
    EXPECT_FALSE(FeatureMatrix::supports(FeatureId::DeltaPull, capability(2, 35)));
    EXPECT_TRUE(FeatureMatrix::supports(FeatureId::DeltaPull, capability(2, 36)));

    EXPECT_FALSE(FeatureMatrix::supports(FeatureId::ConditionalPush, capability(2, 38, 9)));
    EXPECT_TRUE(FeatureMatrix::supports(FeatureId::ConditionalPush, capability(2, 39)));

    EXPECT_FALSE(FeatureMatrix::supports(FeatureId::DataStoreVersioning, capability(2, 41)));
    EXPECT_TRUE(FeatureMatrix::supports(FeatureId::DataStoreVersioning, capability(2, 42)));
}

TEST(FeatureMatrixTest, SupportedFeaturesGrowWithVersion) {
    const auto old_features = FeatureMatrix::supported_features(capability(2, 35));
    const auto new_features = FeatureMatrix::supported_features(capability(2, 42));

    EXPECT_TRUE(old_features.empty());
    EXPECT_EQ(new_features.size(), FeatureMatrix::all_features().size());
}

TEST(FeatureMatrixTest, ParsesFeatureNames) {
    for (auto feature : FeatureMatrix::all_features()) {
        auto parsed = FeatureMatrix::parse_feature(FeatureMatrix::feature_name(feature));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, feature);
    }
    EXPECT_FALSE(FeatureMatrix::parse_feature("time_travel").has_value());
}

TEST(FeatureMatrixTest, SelectsProtocolVariant) {
    const auto legacy = FeatureMatrix::select_protocol(capability(2, 35), 50);
    EXPECT_FALSE(legacy.batched_push);
    EXPECT_FALSE(legacy.delta_pull);
    EXPECT_FALSE(legacy.conditional_push);
    EXPECT_EQ(legacy.batch_size, 1u);

    const auto middle = FeatureMatrix::select_protocol(capability(2, 37), 50);
    EXPECT_TRUE(middle.batched_push);
    EXPECT_TRUE(middle.delta_pull);
    EXPECT_FALSE(middle.conditional_push);
    EXPECT_EQ(middle.batch_size, 50u);

    const auto current = FeatureMatrix::select_protocol(capability(2, 40), 0);
    EXPECT_TRUE(current.conditional_push);
    EXPECT_EQ(current.batch_size, 1u);
}

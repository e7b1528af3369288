#include "osync/core/ids.hpp"
#include "osync/core/result.hpp"

#include <gtest/gtest.h>

#include <set>

using osync::Err;
using osync::ErrorKind;
using osync::Ok;
using osync::Result;

TEST(ResultTest, CarriesValueOrError) {
    Result<int> ok = Ok(7);
    ASSERT_TRUE(ok.is_ok());
    EXPECT_EQ(ok.value(), 7);

    Result<int> failed = Err<int>(ErrorKind::NotFound, "missing");
    ASSERT_TRUE(failed.is_error());
    EXPECT_EQ(failed.error().kind, ErrorKind::NotFound);
    EXPECT_EQ(failed.error().message, "missing");
    EXPECT_EQ(failed.value_or(3), 3);

    Result<void> done = Ok();
    EXPECT_TRUE(done.is_ok());
    Result<void> broken = Err<void>(ErrorKind::Storage, "disk full");
    EXPECT_TRUE(broken.is_error());
}

TEST(ErrorTest, OnlyTransportErrorsAreRetryable) {
    EXPECT_TRUE(osync::make_error(ErrorKind::Network, "").retryable());
    EXPECT_TRUE(osync::make_error(ErrorKind::Timeout, "").retryable());
    EXPECT_FALSE(osync::make_error(ErrorKind::Auth, "").retryable());
    EXPECT_FALSE(osync::make_error(ErrorKind::Validation, "").retryable());
    EXPECT_FALSE(osync::make_error(ErrorKind::VersionIncompatible, "").retryable());
    EXPECT_STREQ(osync::to_string(ErrorKind::ConflictUnresolved), "conflict_unresolved");
}

TEST(IdsTest, GeneratesDistinctCanonicalUuids) {
    std::set<std::string> seen;
    for (int i = 0; i < 1000; ++i) {
        const auto id = osync::generate_uuid();
        ASSERT_EQ(id.size(), 36u);
        EXPECT_EQ(id[8], '-');
        EXPECT_EQ(id[14], '4');
        seen.insert(id);
    }
    EXPECT_EQ(seen.size(), 1000u);
}

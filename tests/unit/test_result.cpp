/**
 * @file test_result.cpp
 * @brief Unit tests for Result<T, E> monadic error type and Error taxonomy.
 */

#include "core/result.hpp"

#include <gtest/gtest.h>

using namespace remote_shipper;

TEST(ResultTest, SuccessValue) {
    Result<int> r = 42;
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, 42);
}

TEST(ResultTest, ErrorValue) {
    Result<int> r = Error{ErrorKind::Transport, "connection refused"};
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().message, "connection refused");
    EXPECT_EQ(r.error().kind, ErrorKind::Transport);
}

TEST(ResultTest, BoolConversion) {
    Result<int> success = 1;
    Result<int> failure = Error{ErrorKind::Encoding, "fail"};
    EXPECT_TRUE(static_cast<bool>(success));
    EXPECT_FALSE(static_cast<bool>(failure));
}

TEST(ResultTest, ValueOr) {
    Result<int> success = 42;
    Result<int> failure = Error{ErrorKind::Encoding, "fail"};
    EXPECT_EQ(success.value_or(0), 42);
    EXPECT_EQ(failure.value_or(0), 0);
}

TEST(ResultTest, Map) {
    Result<int> r = 21;
    auto doubled = r.map([](int v) { return v * 2; });
    ASSERT_TRUE(doubled.has_value());
    EXPECT_EQ(*doubled, 42);
}

TEST(ResultTest, MapOnErrorKeepsKind) {
    Result<int> r = Error{ErrorKind::Resolution, "no such host"};
    auto doubled = r.map([](int v) { return v * 2; });
    ASSERT_FALSE(doubled.has_value());
    EXPECT_EQ(doubled.error().kind, ErrorKind::Resolution);
    EXPECT_EQ(doubled.error().message, "no such host");
}

TEST(ResultTest, AndThenChains) {
    Result<int> r = 5;
    auto chained = r.and_then([](int v) -> Result<std::string> {
        if (v > 3) return std::string("big");
        return Error{ErrorKind::Configuration, "small"};
    });
    ASSERT_TRUE(chained.has_value());
    EXPECT_EQ(*chained, "big");
}

TEST(ResultTest, ValueOnErrorThrows) {
    Result<int> r = Error{ErrorKind::Encoding, "fail"};
    EXPECT_THROW((void)r.value(), std::runtime_error);
}

TEST(ResultTest, VoidResult) {
    Result<void> ok;
    EXPECT_TRUE(ok.has_value());
    EXPECT_THROW((void)ok.error(), std::runtime_error);

    Result<void> failed = Error{ErrorKind::Configuration, "bad url"};
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().kind, ErrorKind::Configuration);
}

TEST(ResultTest, MakeError) {
    auto r = make_error<int>(ErrorKind::Resolution, "lookup failed");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind, ErrorKind::Resolution);
}

TEST(ErrorTest, RemoteRejectedCarriesStatusAndBody) {
    auto err = Error::remote_rejected(503, "overloaded");
    EXPECT_EQ(err.kind, ErrorKind::RemoteRejected);
    EXPECT_EQ(err.http_status, 503);
    EXPECT_EQ(err.body_excerpt, "overloaded");
    EXPECT_NE(err.message.find("503"), std::string::npos);
}

TEST(ErrorTest, KindToString) {
    EXPECT_EQ(to_string(ErrorKind::Configuration), "configuration");
    EXPECT_EQ(to_string(ErrorKind::RemoteRejected), "remote_rejected");
    EXPECT_EQ(to_string(ErrorKind::Encoding), "encoding");
}

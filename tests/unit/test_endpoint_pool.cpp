/**
 * @file test_endpoint_pool.cpp
 * @brief Unit tests for EndpointPool sizing, rotation, and refresh.
 * @author Dimitris Kafetzis
 */

#include "transport/endpoint_pool.hpp"

#include "support/fakes.hpp"

#include <gtest/gtest.h>
#include <chrono>
#include <set>
#include <vector>

using namespace remote_shipper;
using namespace remote_shipper::fakes;
using namespace std::chrono_literals;

namespace {

class EndpointPoolTest : public ::testing::Test {
protected:
    FakeResolver resolver_;
    FakeHandleFactory factory_;
    ManualClock clock_;

    EndpointPool make_pool(PoolConfig settings = {},
                           std::string url = "http://metrics.local:9090/push",
                           uint64_t seed = 7) {
        return EndpointPool(std::move(url), TlsConfig{}, settings,
                            resolver_, factory_, clock_.clock(), seed);
    }
};

}  // namespace

// ═══════════════════════════════════════════════
// Resolution & Sizing
// ═══════════════════════════════════════════════

TEST_F(EndpointPoolTest, UnresolvedPoolIsEmpty) {
    auto pool = make_pool();
    EXPECT_FALSE(pool.is_ready());
    EXPECT_EQ(pool.size(), 0u);
    EXPECT_EQ(pool.resolution_count(), 0u);
    EXPECT_THROW((void)pool.acquire(), std::logic_error);
}

TEST_F(EndpointPoolTest, FiveHandlesPerAddress) {
    resolver_.set_addresses({"10.0.0.1", "10.0.0.2", "10.0.0.3"});
    auto pool = make_pool();

    ASSERT_TRUE(pool.resolve().has_value());
    EXPECT_EQ(pool.address_count(), 3u);
    EXPECT_EQ(pool.size(), 15u);
    EXPECT_EQ(factory_.created(), 15u);
    EXPECT_EQ(pool.cursor(), 0u);
}

TEST_F(EndpointPoolTest, SingleAddressYieldsFiveHandles) {
    auto pool = make_pool();
    ASSERT_TRUE(pool.resolve().has_value());
    EXPECT_EQ(pool.size(), 5u);
}

TEST_F(EndpointPoolTest, MultiplierIsConfigurable) {
    resolver_.set_addresses({"10.0.0.1", "10.0.0.2"});
    PoolConfig settings;
    settings.handles_per_address = 2;
    auto pool = make_pool(settings);

    ASSERT_TRUE(pool.resolve().has_value());
    EXPECT_EQ(pool.size(), 4u);
}

TEST_F(EndpointPoolTest, LooksUpBareHost) {
    auto pool = make_pool({}, "https://user@metrics.local:8443/api/v1/write");
    ASSERT_TRUE(pool.resolve().has_value());
    ASSERT_EQ(resolver_.hosts().size(), 1u);
    EXPECT_EQ(resolver_.hosts()[0], "metrics.local");
}

TEST_F(EndpointPoolTest, HandlesReceiveTlsConfig) {
    TlsConfig tls;
    tls.insecure_skip_verify = true;
    EndpointPool pool("https://metrics.local/push", tls, PoolConfig{},
                      resolver_, factory_, clock_.clock(), 1);

    ASSERT_TRUE(pool.resolve().has_value());
    ASSERT_TRUE(factory_.last_tls().has_value());
    EXPECT_TRUE(factory_.last_tls()->insecure_skip_verify);
}

TEST_F(EndpointPoolTest, DnsFailureIsResolutionError) {
    resolver_.set_fail(true);
    auto pool = make_pool();

    auto result = pool.resolve();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::Resolution);
    EXPECT_FALSE(pool.is_ready());
}

TEST_F(EndpointPoolTest, MalformedUrlFailsBeforeLookup) {
    auto pool = make_pool({}, "not a url");

    auto result = pool.resolve();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::Configuration);
    EXPECT_EQ(resolver_.lookups(), 0u);
}

TEST_F(EndpointPoolTest, BadTlsMaterialFailsBeforeLookup) {
    TlsConfig tls;
    tls.cert_path = "/nonexistent/cert.pem";
    EndpointPool pool("https://metrics.local/push", tls, PoolConfig{},
                      resolver_, factory_, clock_.clock(), 1);

    auto result = pool.resolve();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::Configuration);
    EXPECT_EQ(resolver_.lookups(), 0u);
    EXPECT_EQ(factory_.created(), 0u);
}

// ═══════════════════════════════════════════════
// Refresh deadline
// ═══════════════════════════════════════════════

TEST_F(EndpointPoolTest, DeadlineWithinJitterWindow) {
    for (uint64_t seed = 0; seed < 50; ++seed) {
        auto pool = make_pool({}, "http://metrics.local/push", seed);
        ASSERT_TRUE(pool.resolve().has_value());
        auto offset = pool.refresh_deadline() - clock_.now();
        EXPECT_GE(offset, 60s) << "seed " << seed;
        EXPECT_LT(offset, 150s) << "seed " << seed;
    }
}

TEST_F(EndpointPoolTest, JitterSpreadsDeadlines) {
    std::set<Timestamp> deadlines;
    for (uint64_t seed = 0; seed < 20; ++seed) {
        auto pool = make_pool({}, "http://metrics.local/push", seed);
        ASSERT_TRUE(pool.resolve().has_value());
        deadlines.insert(pool.refresh_deadline());
    }
    EXPECT_GT(deadlines.size(), 1u);
}

TEST_F(EndpointPoolTest, ZeroJitterIsExactlyBase) {
    PoolConfig settings;
    settings.refresh_base_s = 30;
    settings.refresh_jitter_s = 0;
    auto pool = make_pool(settings);

    ASSERT_TRUE(pool.resolve().has_value());
    EXPECT_EQ(pool.refresh_deadline(), clock_.now() + 30s);
}

// ═══════════════════════════════════════════════
// Round-robin
// ═══════════════════════════════════════════════

TEST_F(EndpointPoolTest, AcquireStartsAtOneAndWraps) {
    auto pool = make_pool();
    ASSERT_TRUE(pool.resolve().has_value());
    const size_t k = pool.size();

    std::vector<size_t> cursors;
    for (size_t i = 0; i < k + 2; ++i) {
        (void)pool.acquire();
        cursors.push_back(pool.cursor());
    }

    std::vector<size_t> expected{1, 2, 3, 4, 0, 1, 2};
    EXPECT_EQ(cursors, expected);
}

TEST_F(EndpointPoolTest, AcquireHandsOutDistinctHandlesBeforeWrap) {
    auto pool = make_pool();
    ASSERT_TRUE(pool.resolve().has_value());

    std::set<IHttpHandle*> seen;
    for (size_t i = 0; i < pool.size(); ++i) {
        seen.insert(&pool.acquire());
    }
    EXPECT_EQ(seen.size(), pool.size());
}

// ═══════════════════════════════════════════════
// maybe_refresh
// ═══════════════════════════════════════════════

TEST_F(EndpointPoolTest, NoRefreshBeforeDeadline) {
    auto pool = make_pool();
    ASSERT_TRUE(pool.resolve().has_value());
    (void)pool.acquire();

    clock_.advance(59s);
    ASSERT_TRUE(pool.maybe_refresh().has_value());
    EXPECT_EQ(pool.resolution_count(), 1u);
    EXPECT_EQ(pool.cursor(), 1u);
}

TEST_F(EndpointPoolTest, RefreshAfterDeadlineRebuildsPool) {
    auto pool = make_pool();
    ASSERT_TRUE(pool.resolve().has_value());
    (void)pool.acquire();
    (void)pool.acquire();

    resolver_.set_addresses({"10.0.0.1", "10.0.0.2"});
    clock_.set(pool.refresh_deadline() + 1s);
    ASSERT_TRUE(pool.maybe_refresh().has_value());

    EXPECT_EQ(pool.resolution_count(), 2u);
    EXPECT_EQ(pool.size(), 10u);
    EXPECT_EQ(pool.cursor(), 0u);
    EXPECT_EQ(factory_.created(), 15u);
    EXPECT_GT(pool.refresh_deadline(), clock_.now());
}

TEST_F(EndpointPoolTest, RefreshExactlyAtDeadlineIsSkipped) {
    auto pool = make_pool();
    ASSERT_TRUE(pool.resolve().has_value());

    clock_.set(pool.refresh_deadline());
    ASSERT_TRUE(pool.maybe_refresh().has_value());
    EXPECT_EQ(pool.resolution_count(), 1u);
}

TEST_F(EndpointPoolTest, FailedRefreshKeepsOldPool) {
    auto pool = make_pool();
    ASSERT_TRUE(pool.resolve().has_value());
    (void)pool.acquire();
    const auto old_deadline = pool.refresh_deadline();

    resolver_.set_fail(true);
    clock_.set(old_deadline + 1s);
    auto result = pool.maybe_refresh();

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::Resolution);
    EXPECT_EQ(pool.size(), 5u);
    EXPECT_EQ(pool.cursor(), 1u);
    EXPECT_EQ(pool.refresh_deadline(), old_deadline);

    // The deadline stays expired, so the next attempt retries the lookup.
    resolver_.set_fail(false);
    ASSERT_TRUE(pool.maybe_refresh().has_value());
    EXPECT_EQ(pool.cursor(), 0u);
}

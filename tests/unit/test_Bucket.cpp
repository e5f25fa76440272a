#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "TestSupport.hpp"
#include "core/types/Bucket.hpp"

#include <stdexcept>

using namespace uptimegrid::core;
using namespace std::chrono_literals;
using uptimegrid::test::utc;

TEST_CASE("Bucket factories", "[Bucket]") {
    auto start = utc(2024, 5, 1, 10);
    auto end = start + 1h;

    SECTION("Observed carries its outcome") {
        auto bucket = Bucket::observed(start, end, Outcome::Down);
        REQUIRE(bucket.state() == BucketState::Observed);
        REQUIRE(bucket.outcome() == Outcome::Down);
        REQUIRE(bucket.resolved() == BucketValue::Down);
        REQUIRE_FALSE(bucket.isForwardFilled());
    }

    SECTION("Missing with a filled value resolves to that value") {
        auto bucket = Bucket::missing(start, end, Outcome::Up);
        REQUIRE(bucket.state() == BucketState::Missing);
        REQUIRE(bucket.resolved() == BucketValue::Up);
        REQUIRE(bucket.isForwardFilled());
    }

    SECTION("Missing without a value is no-data") {
        auto bucket = Bucket::missing(start, end, std::nullopt);
        REQUIRE(bucket.resolved() == BucketValue::NoData);
        REQUIRE_FALSE(bucket.isForwardFilled());
    }

    SECTION("Future never carries an outcome") {
        auto bucket = Bucket::future(start, end);
        REQUIRE(bucket.isFuture());
        REQUIRE_FALSE(bucket.outcome().has_value());
        REQUIRE(bucket.resolved() == BucketValue::Future);
    }

    SECTION("Empty or inverted interval is rejected") {
        REQUIRE_THROWS_AS(Bucket::observed(start, start, Outcome::Up), std::invalid_argument);
        REQUIRE_THROWS_AS(Bucket::future(end, start), std::invalid_argument);
    }
}

TEST_CASE("Bucket enum string conversion", "[Bucket]") {
    REQUIRE(bucketStateToString(BucketState::Observed) == "Observed");
    REQUIRE(bucketStateToString(BucketState::Missing) == "Missing");
    REQUIRE(bucketStateToString(BucketState::Future) == "Future");
    REQUIRE(bucketValueToString(BucketValue::NoData) == "NoData");
    REQUIRE(bucketValueToString(BucketValue::Up) == "Up");
}

TEST_CASE("BucketSpec", "[Bucket][BucketSpec]") {
    BucketSpec spec;

    SECTION("Defaults are a 30 day hourly grid") {
        REQUIRE(spec.isValid());
        REQUIRE(spec.bucketCount() == 720);
        REQUIRE(spec.effectiveAlignment() == 1h);
    }

    SECTION("Bucket count rounds up") {
        spec.retention = 150min;
        spec.width = 1h;
        REQUIRE(spec.bucketCount() == 3);
    }

    SECTION("Alignment must be a multiple of the width") {
        spec.width = 1h;
        spec.alignment = 24h;
        REQUIRE(spec.isValid());
        REQUIRE(spec.effectiveAlignment() == 24h);

        spec.alignment = 90min;
        REQUIRE_FALSE(spec.isValid());
    }

    SECTION("Non-positive width or retention is invalid") {
        spec.width = 0min;
        REQUIRE_FALSE(spec.isValid());
        REQUIRE(spec.bucketCount() == 0);

        spec.width = 1h;
        spec.retention = -1h;
        REQUIRE_FALSE(spec.isValid());
    }
}

TEST_CASE("BucketedSeries statistics", "[Bucket][BucketedSeries]") {
    auto t0 = utc(2024, 5, 1);
    BucketedSeries series;
    series.resource = "a";
    series.buckets.push_back(Bucket::observed(t0, t0 + 1h, Outcome::Up));
    series.buckets.push_back(Bucket::missing(t0 + 1h, t0 + 2h, Outcome::Up));
    series.buckets.push_back(Bucket::observed(t0 + 2h, t0 + 3h, Outcome::Down));
    series.buckets.push_back(Bucket::missing(t0 + 3h, t0 + 4h, Outcome::Down));
    series.buckets.push_back(Bucket::future(t0 + 4h, t0 + 5h));

    SECTION("count by resolved value") {
        REQUIRE(series.count(BucketValue::Up) == 2);
        REQUIRE(series.count(BucketValue::Down) == 2);
        REQUIRE(series.count(BucketValue::Future) == 1);
        REQUIRE(series.count(BucketValue::NoData) == 0);
    }

    SECTION("uptimePercent ignores future and no-data buckets") {
        series.buckets.push_back(Bucket::future(t0 + 5h, t0 + 6h));
        REQUIRE_THAT(*series.uptimePercent(), Catch::Matchers::WithinAbs(50.0, 0.001));
    }

    SECTION("uptimePercent is empty without resolved buckets") {
        BucketedSeries empty;
        empty.buckets.push_back(Bucket::missing(t0, t0 + 1h, std::nullopt));
        empty.buckets.push_back(Bucket::future(t0 + 1h, t0 + 2h));
        REQUIRE_FALSE(empty.uptimePercent().has_value());
    }

    SECTION("values") {
        std::vector<BucketValue> expected = {BucketValue::Up, BucketValue::Up, BucketValue::Down,
                                             BucketValue::Down, BucketValue::Future};
        REQUIRE(series.values() == expected);
    }
}

#include <catch2/catch_test_macros.hpp>

#include "TestSupport.hpp"
#include "core/engine/Aggregator.hpp"

#include <stdexcept>

using namespace uptimegrid::core;
using namespace std::chrono_literals;
using uptimegrid::test::observation;
using uptimegrid::test::utc;

namespace {

BucketSpec makeSpec(std::chrono::minutes retention, std::chrono::minutes width,
                    std::chrono::minutes alignment = 0min) {
    BucketSpec spec;
    spec.retention = retention;
    spec.width = width;
    spec.alignment = alignment;
    return spec;
}

} // namespace

TEST_CASE("Aggregator scaffold", "[Aggregator]") {
    ReferenceZone zone("UTC");
    Aggregator aggregator(zone, makeNullLogger());
    auto now = utc(2024, 5, 1, 10, 20);

    SECTION("Bucket count is ceil(retention / width)") {
        for (std::chrono::minutes retention : {60min, 61min, 150min, 43200min}) {
            auto spec = makeSpec(retention, 1h);
            auto series = aggregator.bucketize({}, "a", now, spec);
            REQUIRE(series.buckets.size() == spec.bucketCount());
        }
        REQUIRE(aggregator.bucketize({}, "a", now, makeSpec(150min, 1h)).buckets.size() == 3);
    }

    SECTION("Default alignment ends on the bucket containing now") {
        auto series = aggregator.bucketize({}, "a", now, makeSpec(4h, 1h));
        REQUIRE(series.buckets.back().start() == utc(2024, 5, 1, 10));
        REQUIRE(series.buckets.back().end() == utc(2024, 5, 1, 11));
        REQUIRE(series.buckets.front().start() == utc(2024, 5, 1, 7));
    }

    SECTION("Buckets are contiguous and of equal width") {
        auto series = aggregator.bucketize({}, "a", now, makeSpec(24h, 1h, 24h));
        for (size_t i = 1; i < series.buckets.size(); ++i) {
            REQUIRE(series.buckets[i].start() == series.buckets[i - 1].end());
            REQUIRE(series.buckets[i].end() - series.buckets[i].start() == 1h);
        }
    }

    SECTION("Boundaries do not depend on data") {
        History history;
        history["a"] = {observation("a", Outcome::Up, now - 90min),
                        observation("a", Outcome::Down, now - 7min)};
        auto spec = makeSpec(6h, 1h, 2h);

        auto empty = aggregator.bucketize({}, "a", now, spec);
        auto full = aggregator.bucketize(history, "a", now, spec);
        REQUIRE(empty.buckets.size() == full.buckets.size());
        for (size_t i = 0; i < empty.buckets.size(); ++i) {
            REQUIRE(empty.buckets[i].start() == full.buckets[i].start());
            REQUIRE(empty.buckets[i].end() == full.buckets[i].end());
        }
    }

    SECTION("scaffoldStart matches the first bucket") {
        auto spec = makeSpec(24h * 3, 1h, 24h);
        auto series = aggregator.bucketize({}, "a", now, spec);
        REQUIRE(aggregator.scaffoldStart(now, spec) == series.buckets.front().start());
        REQUIRE(series.buckets.front().start() == utc(2024, 4, 29));
    }
}

TEST_CASE("Aggregator day grid follows the reference zone", "[Aggregator]") {
    ReferenceZone zone("America/New_York");
    Aggregator aggregator(zone, makeNullLogger());

    // 15:00 UTC is 11:00 EDT, so the grid ends at local midnight (04:00 UTC next day)
    auto now = utc(2024, 5, 1, 15);
    auto series = aggregator.bucketize({}, "a", now, makeSpec(24h * 2, 1h, 24h));

    REQUIRE(series.buckets.size() == 48);
    REQUIRE(series.buckets.back().end() == utc(2024, 5, 2, 4));
    REQUIRE(series.buckets.front().start() == utc(2024, 4, 30, 4));
    REQUIRE(series.count(BucketValue::Future) == 12);
}

TEST_CASE("Aggregator masks future buckets", "[Aggregator][Future]") {
    ReferenceZone zone("UTC");
    Aggregator aggregator(zone, makeNullLogger());
    auto now = utc(2024, 5, 1, 10, 30);
    auto spec = makeSpec(24h, 1h, 24h);

    History history;
    for (int h = 0; h <= 10; ++h) {
        history["a"].push_back(observation("a", Outcome::Up, utc(2024, 5, 1, h, 5)));
    }
    auto series = aggregator.bucketize(history, "a", now, spec);

    SECTION("Buckets starting after now are Future") {
        for (const auto& bucket : series.buckets) {
            if (bucket.start() > now) {
                REQUIRE(bucket.isFuture());
            } else {
                REQUIRE_FALSE(bucket.isFuture());
            }
        }
        REQUIRE(series.count(BucketValue::Future) == 13);
    }

    SECTION("Forward fill never reaches into the future") {
        REQUIRE(series.count(BucketValue::Up) == 11);
        REQUIRE(series.buckets[11].resolved() == BucketValue::Future);
    }

    SECTION("The bucket containing now is a past bucket") {
        REQUIRE(series.buckets[10].state() == BucketState::Observed);
    }
}

TEST_CASE("Aggregator forward fill", "[Aggregator][ForwardFill]") {
    ReferenceZone zone("UTC");
    Aggregator aggregator(zone, makeNullLogger());
    auto t0 = utc(2024, 5, 1);
    auto now = t0 + 2h + 30min;
    auto spec = makeSpec(3h, 1h);

    SECTION("Gap takes the previous value") {
        History history;
        history["a"] = {observation("a", Outcome::Up, t0 + 10min),
                        observation("a", Outcome::Down, t0 + 2h + 10min)};
        auto series = aggregator.bucketize(history, "a", now, spec);

        REQUIRE(series.values() ==
                std::vector<BucketValue>{BucketValue::Up, BucketValue::Up, BucketValue::Down});
        REQUIRE(series.buckets[1].state() == BucketState::Missing);
        REQUIRE(series.buckets[1].isForwardFilled());
    }

    SECTION("Fill is seeded from observations before the scaffold") {
        History history;
        history["a"] = {observation("a", Outcome::Down, t0 - 5h)};
        auto series = aggregator.bucketize(history, "a", now, spec);

        REQUIRE(series.values() == std::vector<BucketValue>{BucketValue::Down, BucketValue::Down,
                                                            BucketValue::Down});
        REQUIRE(series.count(BucketValue::NoData) == 0);
    }

    SECTION("No prior observation means no-data") {
        History history;
        history["a"] = {observation("a", Outcome::Up, t0 + 1h + 15min)};
        auto series = aggregator.bucketize(history, "a", now, spec);

        REQUIRE(series.values() ==
                std::vector<BucketValue>{BucketValue::NoData, BucketValue::Up, BucketValue::Up});
    }
}

TEST_CASE("Aggregator latest observation wins within a bucket", "[Aggregator]") {
    ReferenceZone zone("UTC");
    Aggregator aggregator(zone, makeNullLogger());
    auto t0 = utc(2024, 5, 1, 9);

    History history;
    // Stored out of order on purpose
    history["a"] = {observation("a", Outcome::Up, t0 + 40min),
                    observation("a", Outcome::Down, t0 + 10min)};
    auto series = aggregator.bucketize(history, "a", t0 + 50min, makeSpec(1h, 1h));

    REQUIRE(series.buckets.size() == 1);
    REQUIRE(series.buckets[0].state() == BucketState::Observed);
    REQUIRE(series.buckets[0].resolved() == BucketValue::Up);
}

TEST_CASE("Aggregator reference scenarios", "[Aggregator][Scenario]") {
    ReferenceZone zone("UTC");
    Aggregator aggregator(zone, makeNullLogger());

    SECTION("Single observation at now in a one-bucket window") {
        auto t0 = utc(2024, 5, 1, 12);
        History history;
        history["A"] = {observation("A", Outcome::Up, t0)};

        auto series = aggregator.bucketize(history, "A", t0, makeSpec(1h, 1h));
        REQUIRE(series.buckets.size() == 1);
        REQUIRE(series.buckets[0].state() == BucketState::Observed);
        REQUIRE(series.buckets[0].resolved() == BucketValue::Up);
    }

    SECTION("Unknown target over three past buckets and one future bucket") {
        auto now = utc(2024, 5, 1, 2, 30);
        auto series = aggregator.bucketize({}, "B", now, makeSpec(4h, 1h, 4h));

        REQUIRE(series.resource == "B");
        REQUIRE(series.values() == std::vector<BucketValue>{BucketValue::NoData,
                                                            BucketValue::NoData,
                                                            BucketValue::NoData,
                                                            BucketValue::Future});
    }
}

TEST_CASE("Aggregator ignores observations after now", "[Aggregator]") {
    uptimegrid::test::CapturedLog log;
    ReferenceZone zone("UTC");
    Aggregator aggregator(zone, log.logger());
    auto now = utc(2024, 5, 1, 10, 30);

    History history;
    history["a"] = {observation("a", Outcome::Up, utc(2024, 5, 1, 10, 5)),
                    observation("a", Outcome::Down, utc(2024, 5, 1, 10, 45))};
    auto series = aggregator.bucketize(history, "a", now, makeSpec(2h, 1h));

    REQUIRE(series.buckets.back().resolved() == BucketValue::Up);
    REQUIRE(log.contains("Skipping 1 observations for a later than run time"));
}

TEST_CASE("Aggregator reports skewed observations once per series", "[Aggregator]") {
    uptimegrid::test::CapturedLog log;
    ReferenceZone zone("UTC");
    Aggregator aggregator(zone, log.logger());
    auto now = utc(2024, 5, 1, 10, 30);

    History history;
    history["a"] = {observation("a", Outcome::Up, now - 10min)};
    for (int i = 1; i <= 5; ++i) {
        history["a"].push_back(observation("a", Outcome::Down, now + std::chrono::hours(i)));
    }
    auto series = aggregator.bucketize(history, "a", now, makeSpec(2h, 1h));

    REQUIRE(series.buckets.back().resolved() == BucketValue::Up);
    REQUIRE(log.contains("Skipping 5 observations for a"));
    REQUIRE(log.contains("earliest 2024-05-01T11:30:00.000"));

    auto text = log.text();
    auto first = text.find("Skipping");
    REQUIRE(text.find("Skipping", first + 1) == std::string::npos);
}

TEST_CASE("Aggregator bucketizeAll follows the live target list", "[Aggregator]") {
    ReferenceZone zone("UTC");
    Aggregator aggregator(zone, makeNullLogger());
    auto now = utc(2024, 5, 1, 10, 30);

    History history;
    history["removed.example"] = {observation("removed.example", Outcome::Up, now - 10min)};
    history["b.example"] = {observation("b.example", Outcome::Down, now - 10min)};

    std::vector<Target> targets = {{"b.example", "B"}, {"new.example", "New"}};
    auto all = aggregator.bucketizeAll(history, targets, now, makeSpec(2h, 1h));

    REQUIRE(all.size() == 2);
    REQUIRE(all[0].resource == "b.example");
    REQUIRE(all[0].buckets.back().resolved() == BucketValue::Down);
    REQUIRE(all[1].resource == "new.example");
    REQUIRE(all[1].count(BucketValue::NoData) == 2);
}

TEST_CASE("Aggregator rejects invalid specs", "[Aggregator]") {
    ReferenceZone zone("UTC");
    Aggregator aggregator(zone, makeNullLogger());
    auto now = utc(2024, 5, 1);

    REQUIRE_THROWS_AS(aggregator.bucketize({}, "a", now, makeSpec(1h, 0min)),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(aggregator.bucketize({}, "a", now, makeSpec(0min, 1h)),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(aggregator.bucketize({}, "a", now, makeSpec(24h, 1h, 90min)),
                      std::invalid_argument);
}

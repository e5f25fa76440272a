/**
 * @file Bucket.hpp
 * @brief Time bucket, bucket specification and bucketed series types.
 *
 * A bucketed series is the fixed-cadence view the Aggregator derives from a
 * target's history. It is rebuilt on every run and never persisted.
 */

#pragma once

#include "core/types/Observation.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace uptimegrid::core {

/**
 * @brief How a bucket got its value.
 */
enum class BucketState : int {
    Observed = 0, ///< At least one observation landed in the bucket
    Missing = 1,  ///< Past bucket without observations (resolved by fill policy)
    Future = 2    ///< Bucket has not started yet
};

/**
 * @brief Value a renderer draws for a bucket.
 */
enum class BucketValue : int {
    NoData = 0, ///< Nothing observed before or during the bucket
    Down = 1,
    Up = 2,
    Future = 3
};

std::string bucketStateToString(BucketState state);
std::string bucketValueToString(BucketValue value);

/**
 * @brief One fixed-width interval [start, end) of a bucketed series.
 *
 * Constructed only through the named factories so that an Observed bucket
 * always carries an outcome and a Future bucket never does.
 */
class Bucket {
public:
    static Bucket observed(TimePoint start, TimePoint end, Outcome outcome);

    /**
     * @brief Creates a past bucket without observations.
     * @param filled Forward-filled outcome, or nullopt for no-data.
     */
    static Bucket missing(TimePoint start, TimePoint end, std::optional<Outcome> filled);

    static Bucket future(TimePoint start, TimePoint end);

    [[nodiscard]] TimePoint start() const { return start_; }
    [[nodiscard]] TimePoint end() const { return end_; }
    [[nodiscard]] BucketState state() const { return state_; }

    /**
     * @brief Observed or forward-filled outcome; empty for no-data and Future.
     */
    [[nodiscard]] std::optional<Outcome> outcome() const { return outcome_; }

    /**
     * @brief Collapses state and outcome into the value a renderer draws.
     */
    [[nodiscard]] BucketValue resolved() const;

    [[nodiscard]] bool isFuture() const { return state_ == BucketState::Future; }
    [[nodiscard]] bool isForwardFilled() const {
        return state_ == BucketState::Missing && outcome_.has_value();
    }

    bool operator==(const Bucket& other) const = default;

private:
    Bucket(TimePoint start, TimePoint end, BucketState state, std::optional<Outcome> outcome);

    TimePoint start_;
    TimePoint end_;
    BucketState state_{BucketState::Missing};
    std::optional<Outcome> outcome_;
};

/**
 * @brief Shape of a bucket scaffold.
 *
 * The scaffold holds ceil(retention / width) buckets and ends on the first
 * alignment boundary after "now" in the reference timezone. A zero alignment
 * means "align to the bucket width".
 */
struct BucketSpec {
    std::chrono::minutes retention{std::chrono::hours(24 * 30)}; ///< Window covered by the series
    std::chrono::minutes width{std::chrono::hours(1)};           ///< Width of one bucket
    std::chrono::minutes alignment{0};                           ///< Grid period the end snaps to

    /**
     * @brief Checks that width and retention are positive and that the
     *        alignment is zero or a whole multiple of the width.
     */
    [[nodiscard]] bool isValid() const;

    [[nodiscard]] std::chrono::minutes effectiveAlignment() const {
        return alignment.count() > 0 ? alignment : width;
    }

    /**
     * @brief Number of buckets in the scaffold, ceil(retention / width).
     */
    [[nodiscard]] std::size_t bucketCount() const;
};

/**
 * @brief Bucketed view of one target's history.
 */
struct BucketedSeries {
    std::string resource;
    std::vector<Bucket> buckets;

    [[nodiscard]] std::size_t count(BucketValue value) const;

    /**
     * @brief Share of Up among buckets resolved to Up or Down, in percent.
     * @return Percentage, or nullopt when no bucket resolves to a state.
     */
    [[nodiscard]] std::optional<double> uptimePercent() const;

    [[nodiscard]] std::vector<BucketValue> values() const;
};

} // namespace uptimegrid::core

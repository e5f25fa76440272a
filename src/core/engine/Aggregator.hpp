/**
 * @file Aggregator.hpp
 * @brief Resampling of a target's history into a fixed-cadence series.
 */

#pragma once

#include "core/Logging.hpp"
#include "core/time/ReferenceZone.hpp"
#include "core/types/Bucket.hpp"
#include "core/types/Observation.hpp"
#include "core/types/Target.hpp"

#include <string>
#include <vector>

namespace uptimegrid::core {

/**
 * @brief Converts raw observations into a bucketed series for rendering.
 *
 * The bucket scaffold is a function of the run instant, the BucketSpec and the
 * reference zone only; observations are merged into it afterwards, so gaps are
 * structural. Within a bucket the latest observation wins. Past buckets
 * without data are forward-filled from the last known value, and buckets that
 * have not started are always Future.
 */
class Aggregator {
public:
    Aggregator(const ReferenceZone& zone, LoggerPtr logger);

    /**
     * @brief Builds the series for one target.
     * @param history Retained history (may not contain @p resource).
     * @param resource Target address.
     * @param now Reference instant of the run.
     * @param spec Retention, width and alignment of the scaffold.
     * @return Exactly spec.bucketCount() buckets, oldest first.
     * @throws std::invalid_argument if @p spec is not valid.
     */
    [[nodiscard]] BucketedSeries bucketize(const History& history, const std::string& resource,
                                           TimePoint now, const BucketSpec& spec) const;

    /**
     * @brief Builds one series per live target, in target-list order.
     *
     * Targets present only in @p history are not part of the output.
     */
    [[nodiscard]] std::vector<BucketedSeries> bucketizeAll(const History& history,
                                                           const std::vector<Target>& targets,
                                                           TimePoint now,
                                                           const BucketSpec& spec) const;

    /**
     * @brief Start of the first bucket of the scaffold for @p now.
     */
    [[nodiscard]] TimePoint scaffoldStart(TimePoint now, const BucketSpec& spec) const;

private:
    const ReferenceZone& zone_;
    LoggerPtr logger_;
};

} // namespace uptimegrid::core

#include "core/engine/Aggregator.hpp"

#include <algorithm>
#include <optional>
#include <stdexcept>

namespace uptimegrid::core {

Aggregator::Aggregator(const ReferenceZone& zone, LoggerPtr logger)
    : zone_(zone), logger_(std::move(logger)) {}

TimePoint Aggregator::scaffoldStart(TimePoint now, const BucketSpec& spec) const {
    const auto alignment = spec.effectiveAlignment();
    const auto end = zone_.alignDown(now, alignment) + alignment;
    return end - spec.width * static_cast<int64_t>(spec.bucketCount());
}

BucketedSeries Aggregator::bucketize(const History& history, const std::string& resource,
                                     TimePoint now, const BucketSpec& spec) const {
    if (!spec.isValid()) {
        throw std::invalid_argument("Invalid bucket specification: width " +
                                    std::to_string(spec.width.count()) + "min, retention " +
                                    std::to_string(spec.retention.count()) + "min, alignment " +
                                    std::to_string(spec.alignment.count()) + "min");
    }

    BucketedSeries series;
    series.resource = resource;

    std::vector<Observation> observations;
    if (auto it = history.find(resource); it != history.end()) {
        observations.reserve(it->second.size());
        std::size_t skipped = 0;
        std::optional<TimePoint> earliestSkipped;
        for (const auto& observation : it->second) {
            if (observation.timestamp > now) {
                ++skipped;
                if (!earliestSkipped || observation.timestamp < *earliestSkipped) {
                    earliestSkipped = observation.timestamp;
                }
                continue;
            }
            observations.push_back(observation);
        }
        if (skipped > 0) {
            logger_->warn("Skipping {} observations for {} later than run time {} (earliest {})",
                          skipped, resource, zone_.format(now), zone_.format(*earliestSkipped));
        }
        std::stable_sort(observations.begin(), observations.end(),
                         [](const Observation& a, const Observation& b) {
                             return a.timestamp < b.timestamp;
                         });
    }

    const auto count = spec.bucketCount();
    const auto width = std::chrono::duration_cast<Clock::duration>(spec.width);
    const auto origin = scaffoldStart(now, spec);

    // Seed the forward fill with whatever was known before the scaffold.
    std::optional<Outcome> lastKnown;
    auto next = observations.cbegin();
    while (next != observations.cend() && next->timestamp < origin) {
        lastKnown = next->outcome;
        ++next;
    }

    series.buckets.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        const auto start = origin + width * static_cast<Clock::duration::rep>(i);
        const auto end = start + width;

        if (start > now) {
            series.buckets.push_back(Bucket::future(start, end));
            continue;
        }

        std::optional<Outcome> latest;
        while (next != observations.cend() && next->timestamp < end) {
            latest = next->outcome;
            ++next;
        }

        if (latest) {
            lastKnown = latest;
            series.buckets.push_back(Bucket::observed(start, end, *latest));
        } else {
            series.buckets.push_back(Bucket::missing(start, end, lastKnown));
        }
    }

    logger_->debug("Bucketized {}: {} buckets from {} observations ({} observed, {} future)",
                   resource, series.buckets.size(), observations.size(),
                   std::count_if(series.buckets.begin(), series.buckets.end(),
                                 [](const Bucket& b) { return b.state() == BucketState::Observed; }),
                   series.count(BucketValue::Future));
    return series;
}

std::vector<BucketedSeries> Aggregator::bucketizeAll(const History& history,
                                                     const std::vector<Target>& targets,
                                                     TimePoint now, const BucketSpec& spec) const {
    std::vector<BucketedSeries> result;
    result.reserve(targets.size());
    for (const auto& target : targets) {
        result.push_back(bucketize(history, target.address, now, spec));
    }
    return result;
}

} // namespace uptimegrid::core

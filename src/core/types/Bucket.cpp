#include "core/types/Bucket.hpp"

#include <stdexcept>

namespace uptimegrid::core {

std::string bucketStateToString(BucketState state) {
    switch (state) {
    case BucketState::Observed:
        return "Observed";
    case BucketState::Missing:
        return "Missing";
    case BucketState::Future:
        return "Future";
    }
    return "Missing";
}

std::string bucketValueToString(BucketValue value) {
    switch (value) {
    case BucketValue::NoData:
        return "NoData";
    case BucketValue::Down:
        return "Down";
    case BucketValue::Up:
        return "Up";
    case BucketValue::Future:
        return "Future";
    }
    return "NoData";
}

Bucket::Bucket(TimePoint start, TimePoint end, BucketState state, std::optional<Outcome> outcome)
    : start_(start), end_(end), state_(state), outcome_(outcome) {
    if (end_ <= start_) {
        throw std::invalid_argument("Bucket end must be after its start");
    }
}

Bucket Bucket::observed(TimePoint start, TimePoint end, Outcome outcome) {
    return Bucket(start, end, BucketState::Observed, outcome);
}

Bucket Bucket::missing(TimePoint start, TimePoint end, std::optional<Outcome> filled) {
    return Bucket(start, end, BucketState::Missing, filled);
}

Bucket Bucket::future(TimePoint start, TimePoint end) {
    return Bucket(start, end, BucketState::Future, std::nullopt);
}

BucketValue Bucket::resolved() const {
    if (state_ == BucketState::Future) {
        return BucketValue::Future;
    }
    if (!outcome_) {
        return BucketValue::NoData;
    }
    return *outcome_ == Outcome::Up ? BucketValue::Up : BucketValue::Down;
}

bool BucketSpec::isValid() const {
    if (width.count() <= 0 || retention.count() <= 0 || alignment.count() < 0) {
        return false;
    }
    return alignment.count() % width.count() == 0;
}

std::size_t BucketSpec::bucketCount() const {
    if (width.count() <= 0 || retention.count() <= 0) {
        return 0;
    }
    return static_cast<std::size_t>((retention.count() + width.count() - 1) / width.count());
}

std::size_t BucketedSeries::count(BucketValue value) const {
    std::size_t n = 0;
    for (const auto& bucket : buckets) {
        if (bucket.resolved() == value) {
            ++n;
        }
    }
    return n;
}

std::optional<double> BucketedSeries::uptimePercent() const {
    auto up = count(BucketValue::Up);
    auto down = count(BucketValue::Down);
    if (up + down == 0) {
        return std::nullopt;
    }
    return static_cast<double>(up) / static_cast<double>(up + down) * 100.0;
}

std::vector<BucketValue> BucketedSeries::values() const {
    std::vector<BucketValue> result;
    result.reserve(buckets.size());
    for (const auto& bucket : buckets) {
        result.push_back(bucket.resolved());
    }
    return result;
}

} // namespace uptimegrid::core

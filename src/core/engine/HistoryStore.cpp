#include "core/engine/HistoryStore.hpp"

#include <algorithm>

namespace uptimegrid::core {

namespace {

bool earlier(const Observation& a, const Observation& b) {
    return a.timestamp < b.timestamp;
}

} // namespace

HistoryStore::HistoryStore(LoggerPtr logger) : logger_(std::move(logger)) {}

History HistoryStore::mergeAndPrune(const History& existing, const std::vector<Observation>& fresh,
                                    std::chrono::minutes retention, TimePoint now) const {
    const auto cutoff = now - retention;

    History merged = existing;
    for (const auto& observation : fresh) {
        merged[observation.resource].push_back(observation);
    }

    std::size_t dropped = 0;
    for (auto it = merged.begin(); it != merged.end();) {
        auto& observations = it->second;
        auto before = observations.size();

        std::erase_if(observations,
                      [cutoff](const Observation& o) { return o.timestamp < cutoff; });
        dropped += before - observations.size();

        if (observations.empty()) {
            it = merged.erase(it);
            continue;
        }
        std::stable_sort(observations.begin(), observations.end(), earlier);
        ++it;
    }

    logger_->info("Merged {} new observations; kept {} across {} targets, pruned {}",
                  fresh.size(), observationCount(merged), merged.size(), dropped);
    return merged;
}

std::vector<Observation> HistoryStore::expired(const History& history,
                                               std::chrono::minutes retention,
                                               TimePoint now) const {
    const auto cutoff = now - retention;

    std::vector<Observation> result;
    for (const auto& [resource, observations] : history) {
        for (const auto& observation : observations) {
            if (observation.timestamp < cutoff) {
                result.push_back(observation);
            }
        }
    }
    std::stable_sort(result.begin(), result.end(), earlier);
    return result;
}

} // namespace uptimegrid::core

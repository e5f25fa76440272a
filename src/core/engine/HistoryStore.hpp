#pragma once

#include "core/Logging.hpp"
#include "core/types/Observation.hpp"

#include <chrono>
#include <vector>

namespace uptimegrid::core {

/**
 * @brief Merges fresh observations into the retained history and applies the
 *        retention policy.
 *
 * Pure in-memory logic; loading and persisting the history is done by
 * infra::HistoryFile.
 */
class HistoryStore {
public:
    explicit HistoryStore(LoggerPtr logger);

    /**
     * @brief Unions @p fresh into @p existing and drops expired observations.
     *
     * No deduplication: repeated timestamps stay as distinct points. Every
     * observation with timestamp < now - retention is dropped. Each target's
     * observations come back sorted by timestamp (stable), and targets left
     * without observations are removed, so applying the operation again with
     * no fresh observations changes nothing.
     *
     * @param existing History loaded from the previous run.
     * @param fresh Observations produced by this run.
     * @param retention Retention window.
     * @param now Reference instant of the run.
     * @return The merged, pruned history.
     */
    [[nodiscard]] History mergeAndPrune(const History& existing,
                                        const std::vector<Observation>& fresh,
                                        std::chrono::minutes retention, TimePoint now) const;

    /**
     * @brief Observations that mergeAndPrune() would drop from @p history.
     * @return Expired observations sorted by timestamp.
     */
    [[nodiscard]] std::vector<Observation> expired(const History& history,
                                                   std::chrono::minutes retention,
                                                   TimePoint now) const;

private:
    LoggerPtr logger_;
};

} // namespace uptimegrid::core

#pragma once

#include "core/Logging.hpp"
#include "core/time/ReferenceZone.hpp"
#include "core/types/Bucket.hpp"
#include "core/types/Observation.hpp"
#include "core/types/Target.hpp"
#include "infrastructure/config/ConfigManager.hpp"
#include "infrastructure/network/ProbeRunner.hpp"
#include "infrastructure/report/StatusPageWriter.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace uptimegrid::app {

/**
 * @brief What one pass produced.
 */
struct RunReport {
    core::TimePoint now;                        ///< Instant the pass was evaluated at
    std::size_t probed{0};                      ///< Fresh observations taken
    core::History retained;                     ///< History as persisted
    std::vector<core::BucketedSeries> heatmaps; ///< One per live target
    infra::StatusSnapshot snapshot;
    std::size_t failedArtifacts{0};
};

/**
 * @brief One monitoring pass over the live targets.
 *
 * Loads the history, probes, settles the run instant, archives what expired,
 * persists the pruned history and renders the report. The run instant is only
 * settled after probing, so the observations of this pass are part of its
 * report.
 */
class MonitorRun {
public:
    MonitorRun(const infra::AppConfig& config, const core::ReferenceZone& zone,
               core::LoggerPtr logger);

    /**
     * @param targets Live targets, in report order.
     * @param runner Probe runner, or nullptr to render from the stored history.
     * @param pinnedNow Run instant fixed by the operator, if any.
     */
    RunReport execute(const std::vector<core::Target>& targets, infra::ProbeRunner* runner,
                      std::optional<core::TimePoint> pinnedNow);

    /**
     * @brief Picks the instant a pass is evaluated at.
     *
     * A pinned instant wins and the fresh observations are stamped with it.
     * Otherwise the result is the later of @p clock and the newest fresh
     * observation, so nothing just probed lies after the run instant.
     */
    static core::TimePoint settleRunInstant(std::optional<core::TimePoint> pinnedNow,
                                            std::vector<core::Observation>& fresh,
                                            core::TimePoint clock);

private:
    void persist(const core::History& history, const std::vector<core::Observation>& fresh,
                 RunReport& report);
    void render(const std::vector<core::Target>& targets, RunReport& report);

    const infra::AppConfig& config_;
    const core::ReferenceZone& zone_;
    core::LoggerPtr logger_;
};

} // namespace uptimegrid::app

#pragma once

#include "core/Logging.hpp"
#include "core/services/IProbeService.hpp"
#include "core/types/Observation.hpp"
#include "core/types/Target.hpp"

#include <chrono>
#include <vector>

namespace uptimegrid::infra {

/**
 * @brief Checks every configured target once and turns the results into
 *        observations.
 *
 * Targets whose address carries the icmp:// prefix go to the ICMP probe (when
 * one is given); everything else goes to the default probe. Probes run one
 * after the other.
 */
class ProbeRunner {
public:
    /**
     * @param defaultProbe Probe used for plain addresses.
     * @param icmpProbe Probe for icmp:// addresses, or nullptr to use the default.
     * @param timeout Per-check timeout.
     * @param logger Logger for progress and failures.
     */
    ProbeRunner(core::IProbeService& defaultProbe, core::IProbeService* icmpProbe,
                std::chrono::milliseconds timeout, core::LoggerPtr logger);

    /**
     * @brief Probes all targets.
     * @return One observation per valid target, in target order.
     */
    std::vector<core::Observation> runAll(const std::vector<core::Target>& targets);

    core::Observation runOne(const core::Target& target);

private:
    core::IProbeService& probeFor(const core::Target& target);

    core::IProbeService& defaultProbe_;
    core::IProbeService* icmpProbe_;
    std::chrono::milliseconds timeout_;
    core::LoggerPtr logger_;
};

} // namespace uptimegrid::infra

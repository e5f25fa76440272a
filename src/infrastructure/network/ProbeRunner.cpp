#include "infrastructure/network/ProbeRunner.hpp"

#include "core/types/Failure.hpp"
#include "infrastructure/network/IcmpProbe.hpp"

#include <algorithm>

namespace uptimegrid::infra {

ProbeRunner::ProbeRunner(core::IProbeService& defaultProbe, core::IProbeService* icmpProbe,
                         std::chrono::milliseconds timeout, core::LoggerPtr logger)
    : defaultProbe_(defaultProbe), icmpProbe_(icmpProbe), timeout_(timeout),
      logger_(std::move(logger)) {}

core::IProbeService& ProbeRunner::probeFor(const core::Target& target) {
    if (icmpProbe_ && target.address.rfind(IcmpProbe::kScheme, 0) == 0) {
        return *icmpProbe_;
    }
    return defaultProbe_;
}

core::Observation ProbeRunner::runOne(const core::Target& target) {
    auto& probe = probeFor(target);
    logger_->info("Checking {} via {}...", target.address, probe.name());

    core::Observation observation;
    observation.resource = target.address;

    try {
        auto result = probe.probe(target.address, timeout_);
        observation.outcome = result.outcome;
        observation.timestamp = result.timestamp;
    } catch (const std::exception& e) {
        logger_->error("[{}] {} probe threw for {}: {}",
                       core::failureKindToString(core::FailureKind::ProbeFailure), probe.name(),
                       target.address, e.what());
        observation.outcome = core::Outcome::Down;
        observation.timestamp = core::Clock::now();
    }
    return observation;
}

std::vector<core::Observation> ProbeRunner::runAll(const std::vector<core::Target>& targets) {
    std::vector<core::Observation> observations;
    observations.reserve(targets.size());

    for (const auto& target : targets) {
        if (!target.isValid()) {
            logger_->warn("Skipping target with empty address ({})", target.displayName);
            continue;
        }
        observations.push_back(runOne(target));
    }

    auto up = std::count_if(observations.begin(), observations.end(),
                            [](const core::Observation& o) { return o.isUp(); });
    logger_->info("Probed {} targets: {} up, {} down", observations.size(), up,
                  static_cast<long>(observations.size()) - up);
    return observations;
}

} // namespace uptimegrid::infra

#include "app/MonitorRun.hpp"

#include "core/engine/Aggregator.hpp"
#include "core/engine/HistoryStore.hpp"
#include "infrastructure/report/ChartRenderer.hpp"
#include "infrastructure/storage/HistoryFile.hpp"

#include <algorithm>
#include <filesystem>

namespace uptimegrid::app {

MonitorRun::MonitorRun(const infra::AppConfig& config, const core::ReferenceZone& zone,
                       core::LoggerPtr logger)
    : config_(config), zone_(zone), logger_(std::move(logger)) {}

core::TimePoint MonitorRun::settleRunInstant(std::optional<core::TimePoint> pinnedNow,
                                             std::vector<core::Observation>& fresh,
                                             core::TimePoint clock) {
    if (pinnedNow) {
        for (auto& observation : fresh) {
            observation.timestamp = *pinnedNow;
        }
        return *pinnedNow;
    }

    auto now = clock;
    for (const auto& observation : fresh) {
        now = std::max(now, observation.timestamp);
    }
    return now;
}

RunReport MonitorRun::execute(const std::vector<core::Target>& targets,
                              infra::ProbeRunner* runner,
                              std::optional<core::TimePoint> pinnedNow) {
    infra::HistoryFile historyFile(zone_, logger_);
    auto history = historyFile.load(config_.historyFile);

    std::vector<core::Observation> fresh;
    if (runner) {
        fresh = runner->runAll(targets);
    } else {
        logger_->info("Probing disabled; rendering from stored history");
    }

    RunReport report;
    report.probed = fresh.size();
    report.now = settleRunInstant(pinnedNow, fresh, core::Clock::now());
    logger_->info("Evaluating run at {}", zone_.format(report.now));

    persist(history, fresh, report);
    render(targets, report);
    return report;
}

void MonitorRun::persist(const core::History& history,
                         const std::vector<core::Observation>& fresh, RunReport& report) {
    infra::HistoryFile historyFile(zone_, logger_);
    core::HistoryStore store(logger_);

    if (!config_.archiveFile.empty()) {
        auto combined = history;
        for (const auto& observation : fresh) {
            combined[observation.resource].push_back(observation);
        }
        auto expired = store.expired(combined, config_.retention(), report.now);
        historyFile.appendToArchive(config_.archiveFile, expired);
    }

    report.retained = store.mergeAndPrune(history, fresh, config_.retention(), report.now);
    historyFile.save(config_.historyFile, report.retained);
}

void MonitorRun::render(const std::vector<core::Target>& targets, RunReport& report) {
    const std::filesystem::path outputDir = config_.outputDir;

    core::Aggregator aggregator(zone_, logger_);
    auto heatmapSpec = config_.heatmapSpec();
    report.heatmaps = aggregator.bucketizeAll(report.retained, targets, report.now, heatmapSpec);
    auto sparklines =
        aggregator.bucketizeAll(report.retained, targets, report.now, config_.sparklineSpec());

    infra::ChartRenderer charts(zone_, logger_);
    for (std::size_t i = 0; i < targets.size(); ++i) {
        if (!charts.writeHeatmap(outputDir, targets[i], report.heatmaps[i], heatmapSpec)) {
            ++report.failedArtifacts;
        }
        if (!charts.writeSparkline(outputDir, targets[i], sparklines[i])) {
            ++report.failedArtifacts;
        }
    }

    infra::StatusPageWriter page(zone_, logger_);
    report.snapshot = infra::StatusPageWriter::summarize(config_.reportTitle, report.retained,
                                                         targets, report.heatmaps, report.now);
    if (!page.write(outputDir, report.snapshot, config_.footerLinks)) {
        ++report.failedArtifacts;
    }

    if (report.failedArtifacts > 0) {
        logger_->warn("Report rendered with {} failed artifacts", report.failedArtifacts);
    } else {
        logger_->info("Rendered report for {} targets into {}", targets.size(),
                      outputDir.string());
    }
}

} // namespace uptimegrid::app

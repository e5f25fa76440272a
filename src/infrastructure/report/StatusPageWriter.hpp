#pragma once

#include "core/Logging.hpp"
#include "core/time/ReferenceZone.hpp"
#include "core/types/Bucket.hpp"
#include "core/types/Observation.hpp"
#include "core/types/Target.hpp"
#include "infrastructure/config/ConfigManager.hpp"

#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace uptimegrid::infra {

/**
 * @brief Latest state of one live target as shown on the status page.
 */
struct ServiceStatus {
    core::Target target;
    std::optional<core::Observation> latest; ///< Newest observation at or before the run instant
    std::optional<double> uptimePercent;     ///< Over the heatmap window

    /**
     * @brief "Up", "Down", or "Unknown" when the target was never observed.
     */
    [[nodiscard]] std::string statusText() const;
};

/**
 * @brief Snapshot rendered into index.html and status.json.
 */
struct StatusSnapshot {
    std::string title;
    core::TimePoint generatedAt;
    std::optional<core::TimePoint> lastChecked; ///< Newest observation across all targets
    std::vector<ServiceStatus> services;        ///< In target-list order
};

/**
 * @brief Writes the static status page and its JSON counterpart.
 */
class StatusPageWriter {
public:
    StatusPageWriter(const core::ReferenceZone& zone, core::LoggerPtr logger);

    /**
     * @brief Builds the snapshot for the live targets.
     * @param history Retained history.
     * @param targets Live targets, in display order.
     * @param heatmaps Heatmap series per target, same order as @p targets.
     * @param now Run instant; later observations are not "latest".
     */
    static StatusSnapshot summarize(const std::string& title, const core::History& history,
                                    const std::vector<core::Target>& targets,
                                    const std::vector<core::BucketedSeries>& heatmaps,
                                    core::TimePoint now);

    std::string renderHtml(const StatusSnapshot& snapshot,
                           const std::vector<FooterLink>& footerLinks) const;

    nlohmann::json renderJson(const StatusSnapshot& snapshot) const;

    /**
     * @brief Writes index.html and status.json into @p outputDir.
     * @return True if both files were written.
     */
    bool write(const std::filesystem::path& outputDir, const StatusSnapshot& snapshot,
               const std::vector<FooterLink>& footerLinks) const;

    /**
     * @brief Escapes &, <, >, " and ' for HTML text and attribute values.
     */
    static std::string escapeHtml(const std::string& text);

private:
    std::string lastCheckedText(const StatusSnapshot& snapshot) const;

    const core::ReferenceZone& zone_;
    core::LoggerPtr logger_;
};

} // namespace uptimegrid::infra

#pragma once

#include "core/Logging.hpp"
#include "core/types/Bucket.hpp"

#include <chrono>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace uptimegrid::infra {

/**
 * @brief A static link shown in the status page footer.
 */
struct FooterLink {
    std::string title; ///< Heading above the link.
    std::string label; ///< Link text.
    std::string url;   ///< Link target.

    bool operator==(const FooterLink& other) const = default;
};

/**
 * @brief Application configuration settings.
 *
 * Contains all operator-configurable settings: reference timezone, file
 * locations, target list sources, probe behavior, retention and the bucket
 * grids used for rendering.
 */
struct AppConfig {
    // General settings
    std::string referenceTimezone{"America/New_York"}; ///< Zone all timestamps are normalized to.
    std::string reportTitle{"System Status"};          ///< Status page heading.

    // Paths
    std::string targetsFile{"monitoring_targets.txt"};  ///< Target list file.
    std::string historyFile{"docs/data/results.json"};  ///< Persisted history.
    std::string archiveFile{"docs/data/archive.json"};  ///< Expired observations; empty disables.
    std::string outputDir{"docs"};                      ///< Charts, index.html and status.json.
    std::string logFile{"monitor.log"};                 ///< Rotating log file.

    // Targets
    std::string targetsEnvVariable{"PING_TARGETS"}; ///< Comma-separated override; empty disables.
    bool fallbackToDefaultTargets{true};            ///< Use built-in targets when none are found.

    // Probe
    std::string probeMethod{"http"}; ///< Default probe: "http" or "icmp".
    int probeTimeoutMs{10000};       ///< Hard timeout of one check.
    int probeThreads{2};             ///< Worker threads for ICMP checks.

    // Data retention
    int retentionDays{30}; ///< Days of history to keep.

    // Heatmap grid
    int heatmapBucketMinutes{60};      ///< Width of one heatmap cell.
    int heatmapAlignmentMinutes{1440}; ///< Grid period (one column).

    // Sparkline grid
    int sparklineBucketMinutes{360}; ///< Width of one sparkline point.
    int sparklineDays{7};            ///< Window covered by the sparkline.

    // Report
    std::vector<FooterLink> footerLinks; ///< Static footer links.

    [[nodiscard]] std::chrono::minutes retention() const;
    [[nodiscard]] core::BucketSpec heatmapSpec() const;
    [[nodiscard]] core::BucketSpec sparklineSpec() const;
};

/**
 * @brief Loads and saves the application configuration as JSON.
 */
class ConfigManager {
public:
    /**
     * @brief Constructs a ConfigManager for the specified config file.
     * @param configPath Path to the JSON configuration file.
     * @param logger Logger for load/save diagnostics.
     */
    ConfigManager(const std::filesystem::path& configPath, core::LoggerPtr logger);

    /**
     * @brief Loads configuration from disk.
     *
     * A missing file leaves the defaults in place and writes them out. A
     * malformed file is logged and the defaults are kept.
     *
     * @return True if the configuration came from disk or defaults were saved.
     */
    bool load();

    /**
     * @brief Saves configuration to disk.
     * @return True if saved successfully, false otherwise.
     */
    bool save();

    AppConfig& config() { return config_; }
    const AppConfig& config() const { return config_; }

    std::filesystem::path configPath() const { return configPath_; }

    /**
     * @brief Checks the loaded values.
     * @return Human-readable problems; empty when the configuration is usable.
     */
    [[nodiscard]] std::vector<std::string> validate() const;

private:
    nlohmann::json toJson() const;
    void fromJson(const nlohmann::json& j);

    std::filesystem::path configPath_;
    AppConfig config_;
    core::LoggerPtr logger_;
};

} // namespace uptimegrid::infra

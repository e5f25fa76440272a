#include "infrastructure/config/ConfigManager.hpp"

#include "core/types/Failure.hpp"

#include <fstream>

namespace uptimegrid::infra {

std::chrono::minutes AppConfig::retention() const {
    return std::chrono::hours(24) * retentionDays;
}

core::BucketSpec AppConfig::heatmapSpec() const {
    core::BucketSpec spec;
    spec.retention = retention();
    spec.width = std::chrono::minutes(heatmapBucketMinutes);
    spec.alignment = std::chrono::minutes(heatmapAlignmentMinutes);
    return spec;
}

core::BucketSpec AppConfig::sparklineSpec() const {
    core::BucketSpec spec;
    spec.retention = std::chrono::hours(24) * sparklineDays;
    spec.width = std::chrono::minutes(sparklineBucketMinutes);
    return spec;
}

ConfigManager::ConfigManager(const std::filesystem::path& configPath, core::LoggerPtr logger)
    : configPath_(configPath), logger_(std::move(logger)) {}

bool ConfigManager::load() {
    if (!std::filesystem::exists(configPath_)) {
        logger_->info("[{}] Config file {} not found, using defaults",
                      core::failureKindToString(core::FailureKind::ConfigurationMissing),
                      configPath_.string());
        return save();
    }

    try {
        std::ifstream file(configPath_);
        if (!file) {
            logger_->error("Failed to open config file: {}", configPath_.string());
            return false;
        }

        nlohmann::json j;
        file >> j;
        fromJson(j);

        logger_->info("Loaded configuration from {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        logger_->error("Failed to load config {}: {}; using defaults", configPath_.string(),
                       e.what());
        config_ = AppConfig{};
        return false;
    }
}

bool ConfigManager::save() {
    try {
        auto j = toJson();

        auto parent = configPath_.parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent);
        }

        std::ofstream file(configPath_);
        if (!file) {
            logger_->error("Failed to open config file for writing: {}", configPath_.string());
            return false;
        }

        file << j.dump(2);
        logger_->debug("Saved configuration to {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        logger_->error("Failed to save config: {}", e.what());
        return false;
    }
}

std::vector<std::string> ConfigManager::validate() const {
    std::vector<std::string> problems;

    if (config_.probeMethod != "http" && config_.probeMethod != "icmp") {
        problems.push_back("probe.method must be \"http\" or \"icmp\", got \"" +
                           config_.probeMethod + "\"");
    }
    if (config_.probeTimeoutMs <= 0) {
        problems.push_back("probe.timeout_ms must be positive");
    }
    if (config_.probeThreads <= 0) {
        problems.push_back("probe.threads must be positive");
    }
    if (config_.retentionDays <= 0) {
        problems.push_back("retention.days must be positive");
    }
    if (!config_.heatmapSpec().isValid()) {
        problems.push_back("heatmap.bucket_minutes must be positive and divide "
                           "heatmap.alignment_minutes");
    }
    if (!config_.sparklineSpec().isValid()) {
        problems.push_back("sparkline.bucket_minutes and sparkline.days must be positive");
    }
    if (config_.historyFile.empty()) {
        problems.push_back("paths.history_file must not be empty");
    }
    if (config_.outputDir.empty()) {
        problems.push_back("paths.output_dir must not be empty");
    }

    return problems;
}

nlohmann::json ConfigManager::toJson() const {
    nlohmann::json j;

    // General
    j["general"]["reference_timezone"] = config_.referenceTimezone;
    j["general"]["report_title"] = config_.reportTitle;

    // Paths
    j["paths"]["targets_file"] = config_.targetsFile;
    j["paths"]["history_file"] = config_.historyFile;
    j["paths"]["archive_file"] = config_.archiveFile;
    j["paths"]["output_dir"] = config_.outputDir;
    j["paths"]["log_file"] = config_.logFile;

    // Targets
    j["targets"]["env_variable"] = config_.targetsEnvVariable;
    j["targets"]["fallback_to_defaults"] = config_.fallbackToDefaultTargets;

    // Probe
    j["probe"]["method"] = config_.probeMethod;
    j["probe"]["timeout_ms"] = config_.probeTimeoutMs;
    j["probe"]["threads"] = config_.probeThreads;

    // Data retention
    j["retention"]["days"] = config_.retentionDays;

    // Grids
    j["heatmap"]["bucket_minutes"] = config_.heatmapBucketMinutes;
    j["heatmap"]["alignment_minutes"] = config_.heatmapAlignmentMinutes;
    j["sparkline"]["bucket_minutes"] = config_.sparklineBucketMinutes;
    j["sparkline"]["days"] = config_.sparklineDays;

    // Report
    j["report"]["footer_links"] = nlohmann::json::array();
    for (const auto& link : config_.footerLinks) {
        j["report"]["footer_links"].push_back(
            {{"title", link.title}, {"label", link.label}, {"url", link.url}});
    }

    return j;
}

void ConfigManager::fromJson(const nlohmann::json& j) {
    AppConfig defaults;

    // General
    if (j.contains("general")) {
        const auto& g = j["general"];
        config_.referenceTimezone = g.value("reference_timezone", defaults.referenceTimezone);
        config_.reportTitle = g.value("report_title", defaults.reportTitle);
    }

    // Paths
    if (j.contains("paths")) {
        const auto& p = j["paths"];
        config_.targetsFile = p.value("targets_file", defaults.targetsFile);
        config_.historyFile = p.value("history_file", defaults.historyFile);
        config_.archiveFile = p.value("archive_file", defaults.archiveFile);
        config_.outputDir = p.value("output_dir", defaults.outputDir);
        config_.logFile = p.value("log_file", defaults.logFile);
    }

    // Targets
    if (j.contains("targets")) {
        const auto& t = j["targets"];
        config_.targetsEnvVariable = t.value("env_variable", defaults.targetsEnvVariable);
        config_.fallbackToDefaultTargets =
            t.value("fallback_to_defaults", defaults.fallbackToDefaultTargets);
    }

    // Probe
    if (j.contains("probe")) {
        const auto& p = j["probe"];
        config_.probeMethod = p.value("method", defaults.probeMethod);
        config_.probeTimeoutMs = p.value("timeout_ms", defaults.probeTimeoutMs);
        config_.probeThreads = p.value("threads", defaults.probeThreads);
    }

    // Data retention
    if (j.contains("retention")) {
        config_.retentionDays = j["retention"].value("days", defaults.retentionDays);
    }

    // Grids
    if (j.contains("heatmap")) {
        const auto& h = j["heatmap"];
        config_.heatmapBucketMinutes = h.value("bucket_minutes", defaults.heatmapBucketMinutes);
        config_.heatmapAlignmentMinutes =
            h.value("alignment_minutes", defaults.heatmapAlignmentMinutes);
    }
    if (j.contains("sparkline")) {
        const auto& s = j["sparkline"];
        config_.sparklineBucketMinutes =
            s.value("bucket_minutes", defaults.sparklineBucketMinutes);
        config_.sparklineDays = s.value("days", defaults.sparklineDays);
    }

    // Report
    if (j.contains("report") && j["report"].contains("footer_links")) {
        config_.footerLinks.clear();
        for (const auto& link : j["report"]["footer_links"]) {
            FooterLink footerLink;
            footerLink.title = link.value("title", "");
            footerLink.label = link.value("label", "");
            footerLink.url = link.value("url", "");
            if (!footerLink.url.empty()) {
                config_.footerLinks.push_back(footerLink);
            }
        }
    }
}

} // namespace uptimegrid::infra

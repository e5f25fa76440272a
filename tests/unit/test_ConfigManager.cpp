#include <catch2/catch_test_macros.hpp>

#include "TestSupport.hpp"
#include "infrastructure/config/ConfigManager.hpp"

#include <filesystem>
#include <fstream>

using namespace uptimegrid::infra;
using namespace uptimegrid::core;
using namespace std::chrono_literals;
using uptimegrid::test::TempDir;

namespace {

void writeJson(const std::filesystem::path& path, const nlohmann::json& j) {
    std::ofstream file(path);
    file << j.dump(2);
}

} // namespace

TEST_CASE("ConfigManager load operations", "[ConfigManager]") {
    TempDir testDir("config");
    auto configPath = testDir.file("uptimegrid.json");

    SECTION("load creates config file with defaults when file does not exist") {
        ConfigManager manager(configPath, makeNullLogger());

        REQUIRE_FALSE(std::filesystem::exists(manager.configPath()));

        bool result = manager.load();

        REQUIRE(result);
        REQUIRE(std::filesystem::exists(manager.configPath()));
    }

    SECTION("load creates missing parent directories") {
        ConfigManager manager(testDir.file("nested/dir/uptimegrid.json"), makeNullLogger());
        REQUIRE(manager.load());
        REQUIRE(std::filesystem::exists(testDir.file("nested/dir/uptimegrid.json")));
    }

    SECTION("load returns defaults when config file does not exist") {
        ConfigManager manager(configPath, makeNullLogger());
        manager.load();

        const auto& config = manager.config();
        REQUIRE(config.referenceTimezone == "America/New_York");
        REQUIRE(config.reportTitle == "System Status");
        REQUIRE(config.targetsFile == "monitoring_targets.txt");
        REQUIRE(config.historyFile == "docs/data/results.json");
        REQUIRE(config.archiveFile == "docs/data/archive.json");
        REQUIRE(config.outputDir == "docs");
        REQUIRE(config.logFile == "monitor.log");
        REQUIRE(config.targetsEnvVariable == "PING_TARGETS");
        REQUIRE(config.fallbackToDefaultTargets == true);
        REQUIRE(config.probeMethod == "http");
        REQUIRE(config.probeTimeoutMs == 10000);
        REQUIRE(config.retentionDays == 30);
        REQUIRE(config.heatmapBucketMinutes == 60);
        REQUIRE(config.heatmapAlignmentMinutes == 1440);
        REQUIRE(config.sparklineBucketMinutes == 360);
        REQUIRE(config.sparklineDays == 7);
        REQUIRE(config.footerLinks.empty());
        REQUIRE(manager.validate().empty());
    }

    SECTION("load reads existing config file") {
        nlohmann::json j;
        j["general"]["reference_timezone"] = "Europe/Berlin";
        j["general"]["report_title"] = "Lab Status";
        j["paths"]["history_file"] = "data/history.json";
        j["paths"]["archive_file"] = "";
        j["targets"]["fallback_to_defaults"] = false;
        j["probe"]["method"] = "icmp";
        j["probe"]["timeout_ms"] = 2500;
        j["retention"]["days"] = 14;
        j["heatmap"]["bucket_minutes"] = 30;
        j["report"]["footer_links"] = {
            {{"title", "Upstream"}, {"label", "Provider status"}, {"url", "https://status.example"}}};
        writeJson(configPath, j);

        ConfigManager manager(configPath, makeNullLogger());
        bool result = manager.load();

        REQUIRE(result);
        const auto& config = manager.config();
        REQUIRE(config.referenceTimezone == "Europe/Berlin");
        REQUIRE(config.reportTitle == "Lab Status");
        REQUIRE(config.historyFile == "data/history.json");
        REQUIRE(config.archiveFile.empty());
        REQUIRE(config.fallbackToDefaultTargets == false);
        REQUIRE(config.probeMethod == "icmp");
        REQUIRE(config.probeTimeoutMs == 2500);
        REQUIRE(config.retentionDays == 14);
        REQUIRE(config.heatmapBucketMinutes == 30);
        REQUIRE(config.footerLinks.size() == 1);
        REQUIRE(config.footerLinks[0].url == "https://status.example");
    }

    SECTION("load handles partial config with defaults for missing fields") {
        nlohmann::json j;
        j["probe"]["timeout_ms"] = 500;
        writeJson(configPath, j);

        ConfigManager manager(configPath, makeNullLogger());
        manager.load();

        REQUIRE(manager.config().probeTimeoutMs == 500);
        REQUIRE(manager.config().probeMethod == "http");
        REQUIRE(manager.config().retentionDays == 30);
    }

    SECTION("Footer links without url are dropped") {
        nlohmann::json j;
        j["report"]["footer_links"] = {{{"title", "Nowhere"}, {"label", "x"}}};
        writeJson(configPath, j);

        ConfigManager manager(configPath, makeNullLogger());
        manager.load();
        REQUIRE(manager.config().footerLinks.empty());
    }

    SECTION("load returns false for invalid JSON and keeps defaults") {
        std::ofstream file(configPath);
        file << "{ invalid json content }}}";
        file.close();

        uptimegrid::test::CapturedLog log;
        ConfigManager manager(configPath, log.logger());
        bool result = manager.load();

        REQUIRE_FALSE(result);
        REQUIRE(manager.config().retentionDays == 30);
        REQUIRE(log.contains("Failed to load config"));
    }

    SECTION("load resets to defaults on a type mismatch") {
        nlohmann::json j;
        j["general"]["report_title"] = "Changed";
        j["retention"]["days"] = "thirty";
        writeJson(configPath, j);

        ConfigManager manager(configPath, makeNullLogger());
        REQUIRE_FALSE(manager.load());
        REQUIRE(manager.config().reportTitle == "System Status");
        REQUIRE(manager.config().retentionDays == 30);
    }
}

TEST_CASE("ConfigManager save operations", "[ConfigManager]") {
    TempDir testDir("config_save");
    auto configPath = testDir.file("uptimegrid.json");

    SECTION("save persists configuration changes") {
        {
            ConfigManager manager(configPath, makeNullLogger());
            manager.config().reportTitle = "Saved";
            manager.config().sparklineDays = 3;
            manager.config().footerLinks.push_back({"Docs", "Read me", "https://docs.example"});
            REQUIRE(manager.save());
        }

        ConfigManager reloaded(configPath, makeNullLogger());
        REQUIRE(reloaded.load());
        REQUIRE(reloaded.config().reportTitle == "Saved");
        REQUIRE(reloaded.config().sparklineDays == 3);
        REQUIRE(reloaded.config().footerLinks ==
                std::vector<FooterLink>{{"Docs", "Read me", "https://docs.example"}});
    }

    SECTION("Saved file groups settings by section") {
        ConfigManager manager(configPath, makeNullLogger());
        REQUIRE(manager.save());

        std::ifstream file(configPath);
        nlohmann::json j;
        file >> j;
        for (const char* section : {"general", "paths", "targets", "probe", "retention", "heatmap",
                                    "sparkline", "report"}) {
            REQUIRE(j.contains(section));
        }
        REQUIRE(j["paths"]["history_file"] == "docs/data/results.json");
    }
}

TEST_CASE("ConfigManager derived bucket specs", "[ConfigManager]") {
    AppConfig config;

    SECTION("Heatmap is an hourly grid aligned to days") {
        auto spec = config.heatmapSpec();
        REQUIRE(spec.retention == 24h * 30);
        REQUIRE(spec.width == 1h);
        REQUIRE(spec.alignment == 24h);
        REQUIRE(spec.bucketCount() == 720);
    }

    SECTION("Sparkline uses 6 hour buckets over 7 days") {
        auto spec = config.sparklineSpec();
        REQUIRE(spec.retention == 24h * 7);
        REQUIRE(spec.width == 6h);
        REQUIRE(spec.bucketCount() == 28);
    }

    SECTION("Retention follows the configured days") {
        config.retentionDays = 2;
        REQUIRE(config.retention() == 48h);
        REQUIRE(config.heatmapSpec().retention == 48h);
    }
}

TEST_CASE("ConfigManager validation", "[ConfigManager]") {
    TempDir testDir("config_validate");
    ConfigManager manager(testDir.file("uptimegrid.json"), makeNullLogger());
    auto& config = manager.config();

    SECTION("Defaults are valid") {
        REQUIRE(manager.validate().empty());
    }

    SECTION("Unknown probe method") {
        config.probeMethod = "carrier-pigeon";
        REQUIRE(manager.validate().size() == 1);
    }

    SECTION("Heatmap width must divide the alignment") {
        config.heatmapBucketMinutes = 45;
        config.heatmapAlignmentMinutes = 60;
        REQUIRE_FALSE(manager.validate().empty());
    }

    SECTION("Non-positive values are rejected") {
        config.retentionDays = 0;
        config.probeTimeoutMs = -1;
        config.sparklineBucketMinutes = 0;
        REQUIRE(manager.validate().size() >= 3);
    }

    SECTION("History file is required") {
        config.historyFile.clear();
        REQUIRE_FALSE(manager.validate().empty());
    }
}

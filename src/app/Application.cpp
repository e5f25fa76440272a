#include "app/Application.hpp"

#include "app/MonitorRun.hpp"
#include "core/types/Failure.hpp"
#include "infrastructure/config/TargetListReader.hpp"
#include "infrastructure/network/HttpProbe.hpp"
#include "infrastructure/network/IcmpProbe.hpp"
#include "infrastructure/network/ProbeRunner.hpp"
#include "infrastructure/network/ProbeWorkers.hpp"

#include <QCommandLineParser>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace uptimegrid::app {

Application::Application(int& argc, char** argv) {
    // Charts are drawn without a display
    if (qEnvironmentVariableIsEmpty("QT_QPA_PLATFORM")) {
        qputenv("QT_QPA_PLATFORM", "offscreen");
    }

    qtApp_ = std::make_unique<QGuiApplication>(argc, argv);
    qtApp_->setApplicationName("UptimeGrid");
    qtApp_->setApplicationVersion("1.0.0");
    qtApp_->setOrganizationName("UptimeGrid");

    parseArguments();
    initializeLogging();
    initializeComponents();
}

Application::~Application() {
    if (logger_) {
        logger_->flush();
    }
}

void Application::parseArguments() {
    QCommandLineParser parser;
    parser.setApplicationDescription("Checks targets and renders their uptime history.");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption configOption(QStringList{"c", "config"}, "Configuration file.", "file",
                                    "uptimegrid.json");
    QCommandLineOption nowOption("now", "Pin the run instant (ISO-8601).", "timestamp");
    QCommandLineOption noProbeOption("no-probe", "Render from the stored history only.");
    parser.addOption(configOption);
    parser.addOption(nowOption);
    parser.addOption(noProbeOption);

    parser.process(*qtApp_);

    options_.configPath = parser.value(configOption).toStdString();
    if (parser.isSet(nowOption)) {
        options_.now = parser.value(nowOption).toStdString();
    }
    options_.probe = !parser.isSet(noProbeOption);
}

void Application::initializeLogging() {
    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_level(spdlog::level::info);

    logger_ = std::make_shared<spdlog::logger>("uptimegrid", consoleSink);
    logger_->set_level(spdlog::level::debug);
    spdlog::set_default_logger(logger_);

    logger_->info("UptimeGrid {} starting...", qtApp_->applicationVersion().toStdString());
}

void Application::addFileSink(const std::string& logFile) {
    if (logFile.empty()) {
        return;
    }
    try {
        auto logPath = std::filesystem::path(logFile);
        if (logPath.has_parent_path()) {
            std::filesystem::create_directories(logPath.parent_path());
        }
        auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logPath.string(), 5 * 1024 * 1024, 3);
        fileSink->set_level(spdlog::level::debug);
        logger_->sinks().push_back(fileSink);
        logger_->info("Log file: {}", logPath.string());
    } catch (const std::exception& e) {
        logger_->warn("Could not open log file {}: {}", logFile, e.what());
    }
}

void Application::initializeComponents() {
    // Configuration
    config_ = std::make_unique<infra::ConfigManager>(options_.configPath, logger_);
    config_->load();
    addFileSink(config_->config().logFile);

    auto problems = config_->validate();
    if (!problems.empty()) {
        for (const auto& problem : problems) {
            logger_->error("[{}] {}",
                           core::failureKindToString(core::FailureKind::Misconfiguration),
                           problem);
        }
        throw core::ConfigurationError("Invalid configuration in " +
                                       options_.configPath.string());
    }

    zone_ = std::make_unique<core::ReferenceZone>(config_->config().referenceTimezone);

    logger_->info("Application components initialized (timezone {})", zone_->id());
}

std::optional<core::TimePoint> Application::pinnedNow() const {
    if (!options_.now) {
        return std::nullopt;
    }
    auto pinned = zone_->parse(*options_.now);
    if (!pinned) {
        throw core::ConfigurationError("Invalid --now timestamp: " + *options_.now);
    }
    logger_->info("Run instant pinned to {}", zone_->format(*pinned));
    return pinned;
}

int Application::run() {
    const auto& cfg = config_->config();
    const auto pinned = pinnedNow();

    infra::TargetListReader targetReader(cfg.fallbackToDefaultTargets, logger_);
    auto targets = targetReader.read(
        cfg.targetsFile, infra::TargetListReader::environmentValue(cfg.targetsEnvVariable));

    MonitorRun pass(cfg, *zone_, logger_);
    RunReport report;
    if (options_.probe) {
        infra::ProbeWorkers workers(static_cast<size_t>(cfg.probeThreads), logger_);
        infra::HttpProbe httpProbe(logger_);
        infra::IcmpProbe icmpProbe(workers, logger_);
        core::IProbeService& defaultProbe =
            cfg.probeMethod == "icmp" ? static_cast<core::IProbeService&>(icmpProbe)
                                      : static_cast<core::IProbeService&>(httpProbe);

        infra::ProbeRunner runner(defaultProbe, &icmpProbe,
                                  std::chrono::milliseconds(cfg.probeTimeoutMs), logger_);
        report = pass.execute(targets, &runner, pinned);
        workers.finish();
    } else {
        report = pass.execute(targets, nullptr, pinned);
    }

    logger_->info("Run complete: {} checks, {} observations retained", report.probed,
                  core::observationCount(report.retained));
    return 0;
}

} // namespace uptimegrid::app

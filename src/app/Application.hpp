#pragma once

#include "core/Logging.hpp"
#include "core/time/ReferenceZone.hpp"
#include "core/types/Observation.hpp"
#include "infrastructure/config/ConfigManager.hpp"

#include <QGuiApplication>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace uptimegrid::app {

/**
 * @brief Command-line options of one run.
 */
struct RunOptions {
    std::filesystem::path configPath{"uptimegrid.json"};
    std::optional<std::string> now; ///< Pinned run instant (ISO-8601)
    bool probe{true};               ///< False re-renders from the stored history
};

/**
 * @brief One monitoring run: probe, merge, persist, render.
 */
class Application {
public:
    Application(int& argc, char** argv);
    ~Application();

    /**
     * @brief Executes the run.
     * @return Process exit status (0 for a completed run).
     * @throws core::ConfigurationError on operator misconfiguration.
     */
    int run();

    const RunOptions& options() const { return options_; }

private:
    void parseArguments();
    void initializeLogging();
    void initializeComponents();
    void addFileSink(const std::string& logFile);

    std::optional<core::TimePoint> pinnedNow() const;

    std::unique_ptr<QGuiApplication> qtApp_;
    RunOptions options_;
    core::LoggerPtr logger_;
    std::unique_ptr<infra::ConfigManager> config_;
    std::unique_ptr<core::ReferenceZone> zone_;
};

} // namespace uptimegrid::app

#include "app/Application.hpp"
#include "core/types/Failure.hpp"

#include <spdlog/spdlog.h>

int main(int argc, char* argv[]) {
    try {
        uptimegrid::app::Application app(argc, argv);
        return app.run();
    } catch (const uptimegrid::core::ConfigurationError& e) {
        spdlog::critical("Configuration error: {}", e.what());
        return 2;
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}

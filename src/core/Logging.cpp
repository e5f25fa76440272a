#include "core/Logging.hpp"

#include <spdlog/sinks/null_sink.h>

namespace uptimegrid::core {

LoggerPtr makeNullLogger(const std::string& name) {
    return std::make_shared<spdlog::logger>(name, std::make_shared<spdlog::sinks::null_sink_mt>());
}

} // namespace uptimegrid::core

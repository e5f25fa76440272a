#include "infrastructure/config/TargetListReader.hpp"

#include "core/types/Failure.hpp"

#include <cstdlib>
#include <fstream>
#include <set>
#include <sstream>

namespace uptimegrid::infra {

namespace {

std::string trim(const std::string& s) {
    const char* whitespace = " \t\r\n";
    auto first = s.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return {};
    }
    auto last = s.find_last_not_of(whitespace);
    return s.substr(first, last - first + 1);
}

std::vector<std::string> split(const std::string& text, char separator) {
    std::vector<std::string> parts;
    std::istringstream stream(text);
    std::string part;
    while (std::getline(stream, part, separator)) {
        parts.push_back(part);
    }
    return parts;
}

} // namespace

TargetListReader::TargetListReader(bool fallbackToDefaults, core::LoggerPtr logger)
    : fallbackToDefaults_(fallbackToDefaults), logger_(std::move(logger)) {}

std::vector<core::Target> TargetListReader::defaultTargets() {
    return {{"google.com", "Google"}, {"github.com", "GitHub"}};
}

std::optional<std::string> TargetListReader::environmentValue(const std::string& name) {
    if (name.empty()) {
        return std::nullopt;
    }
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

std::optional<core::Target> TargetListReader::parseEntry(const std::string& entry) {
    auto line = trim(entry);
    if (line.empty() || line.front() == '#') {
        return std::nullopt;
    }

    core::Target target;
    auto eq = line.find('=');
    if (eq != std::string::npos && line.substr(0, eq).find("://") == std::string::npos) {
        target.displayName = trim(line.substr(0, eq));
        target.address = trim(line.substr(eq + 1));
    } else {
        target.address = line;
    }

    if (!target.isValid()) {
        return std::nullopt;
    }
    if (target.displayName.empty()) {
        target.displayName = target.address;
    }
    return target;
}

std::vector<core::Target> TargetListReader::parseEntries(
    const std::vector<std::string>& entries) const {
    std::vector<core::Target> targets;
    std::set<std::string> seen;

    for (const auto& entry : entries) {
        auto target = parseEntry(entry);
        if (!target) {
            auto text = trim(entry);
            if (!text.empty() && text.front() != '#') {
                logger_->warn("Ignoring target entry without address: '{}'", text);
            }
            continue;
        }
        if (!seen.insert(target->address).second) {
            logger_->warn("Ignoring duplicate target {} ({})", target->address,
                          target->displayName);
            continue;
        }
        targets.push_back(*target);
    }
    return targets;
}

std::vector<core::Target> TargetListReader::parseLines(const std::string& text) const {
    return parseEntries(split(text, '\n'));
}

std::vector<core::Target> TargetListReader::parseList(const std::string& text) const {
    return parseEntries(split(text, ','));
}

std::vector<core::Target> TargetListReader::fallback(const std::string& reason) const {
    if (!fallbackToDefaults_) {
        throw core::ConfigurationError(reason + " and fallback to default targets is disabled");
    }
    logger_->warn("[{}] {}. Using default targets.",
                  core::failureKindToString(core::FailureKind::ConfigurationMissing), reason);
    return defaultTargets();
}

std::vector<core::Target> TargetListReader::read(
    const std::filesystem::path& file, const std::optional<std::string>& envOverride) const {
    if (envOverride && !trim(*envOverride).empty()) {
        auto targets = parseList(*envOverride);
        if (!targets.empty()) {
            logger_->info("Loaded {} targets from the environment", targets.size());
            return targets;
        }
        logger_->warn("Environment target list contains no usable entries");
    }

    std::ifstream in(file);
    if (!in) {
        return fallback("'" + file.string() + "' not found");
    }

    std::stringstream buffer;
    buffer << in.rdbuf();
    auto targets = parseLines(buffer.str());
    if (targets.empty()) {
        return fallback("'" + file.string() + "' is empty");
    }

    logger_->info("Loaded {} targets from '{}'", targets.size(), file.string());
    return targets;
}

} // namespace uptimegrid::infra

#pragma once

#include "core/Logging.hpp"
#include "core/types/Target.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace uptimegrid::infra {

/**
 * @brief Reads the live target list.
 *
 * Grammar of one entry: a bare address, or "DisplayName=address". The split
 * happens at the first '=' unless the text before it contains "://" (a URL
 * with a query string). Blank entries and entries starting with '#' are
 * ignored; exact duplicate addresses keep the first entry.
 */
class TargetListReader {
public:
    /**
     * @param fallbackToDefaults Return defaultTargets() when no target is found;
     *        otherwise read() throws core::ConfigurationError.
     * @param logger Logger for skipped entries and fallbacks.
     */
    TargetListReader(bool fallbackToDefaults, core::LoggerPtr logger);

    /**
     * @brief Resolves the target list for this run.
     *
     * A non-empty environment override takes precedence over the file.
     *
     * @param file Newline-delimited target file.
     * @param envOverride Comma-separated entries, if the variable is set.
     * @return Non-empty target list.
     * @throws core::ConfigurationError if no target is found and fallback is off.
     */
    std::vector<core::Target> read(const std::filesystem::path& file,
                                   const std::optional<std::string>& envOverride) const;

    /**
     * @brief Parses the text of a target file (one entry per line).
     */
    std::vector<core::Target> parseLines(const std::string& text) const;

    /**
     * @brief Parses a comma-separated list of entries.
     */
    std::vector<core::Target> parseList(const std::string& text) const;

    /**
     * @brief Parses one entry.
     * @return The target, or nullopt for blank, comment or invalid entries.
     */
    static std::optional<core::Target> parseEntry(const std::string& entry);

    static std::vector<core::Target> defaultTargets();

    /**
     * @brief Reads an environment variable.
     * @return The value, or nullopt if unset or the name is empty.
     */
    static std::optional<std::string> environmentValue(const std::string& name);

private:
    std::vector<core::Target> parseEntries(const std::vector<std::string>& entries) const;
    std::vector<core::Target> fallback(const std::string& reason) const;

    bool fallbackToDefaults_;
    core::LoggerPtr logger_;
};

} // namespace uptimegrid::infra

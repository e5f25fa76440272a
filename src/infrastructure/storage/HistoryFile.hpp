#pragma once

#include "core/Logging.hpp"
#include "core/time/ReferenceZone.hpp"
#include "core/types/Observation.hpp"

#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <vector>

namespace uptimegrid::infra {

/**
 * @brief JSON persistence of the observation history.
 *
 * The file is an array of {resource, status, timestamp} objects. Reading is
 * tolerant: a missing or malformed file yields an empty history, and a bad
 * record is skipped without affecting the others. Timestamps are normalized
 * through the reference zone on the way in and written in that zone with its
 * UTC offset on the way out.
 */
class HistoryFile {
public:
    HistoryFile(const core::ReferenceZone& zone, core::LoggerPtr logger);

    /**
     * @brief Loads the history; never throws for I/O or format problems.
     * @param path History file.
     * @return The stored history, or an empty one if the file is unusable.
     */
    core::History load(const std::filesystem::path& path) const;

    /**
     * @brief Atomically replaces the history file.
     * @return False (after logging) if the file could not be written.
     */
    bool save(const std::filesystem::path& path, const core::History& history) const;

    /**
     * @brief Appends expired observations to an archive file of the same format.
     * An existing archive that cannot be parsed is left untouched, and records
     * inside it that fail to decode are written back unchanged.
     *
     * @return True if nothing needed archiving or the archive was written.
     */
    bool appendToArchive(const std::filesystem::path& path,
                         const std::vector<core::Observation>& expired) const;

    nlohmann::json encode(const core::Observation& observation) const;

    /**
     * @brief Decodes one record.
     *
     * Accepts "target" for "resource" and "outcome" for "status", status
     * values in any case, and ignores unknown fields.
     *
     * @param record JSON value from the array.
     * @param index Position in the file, for diagnostics.
     * @return The observation, or nullopt (after a warning) if unusable.
     */
    std::optional<core::Observation> decode(const nlohmann::json& record,
                                            std::size_t index) const;

private:
    // nullopt when the file exists but cannot be used; empty when it is missing.
    std::optional<nlohmann::json> readDocument(const std::filesystem::path& path) const;
    std::optional<std::vector<core::Observation>> readRecords(
        const std::filesystem::path& path) const;
    // Appends the sorted observations to document and replaces the file.
    bool writeRecords(const std::filesystem::path& path,
                      std::vector<core::Observation> observations,
                      nlohmann::json document) const;

    const core::ReferenceZone& zone_;
    core::LoggerPtr logger_;
};

} // namespace uptimegrid::infra

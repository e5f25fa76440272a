/**
 * @file ReferenceZone.hpp
 * @brief Timestamp normalization against a single reference timezone.
 */

#pragma once

#include "core/types/Observation.hpp"

#include <QDateTime>
#include <QTimeZone>

#include <chrono>
#include <optional>
#include <string>

namespace uptimegrid::core {

/**
 * @brief The one timezone every timestamp is normalized to.
 *
 * Parsing localizes naive timestamps in this zone instead of comparing them
 * against zone-aware ones as if they were equal. Bucket grids are aligned to
 * this zone's wall clock.
 */
class ReferenceZone {
public:
    /**
     * @brief Constructs a zone from an IANA identifier (e.g., "America/New_York").
     * @param ianaId Zone identifier.
     * @throws ConfigurationError if the zone is unknown to the system.
     */
    explicit ReferenceZone(const std::string& ianaId);

    [[nodiscard]] const std::string& id() const { return id_; }

    /**
     * @brief Parses an ISO-8601 timestamp.
     *
     * Accepts "Z" or numeric offsets, fractional seconds of any precision
     * (truncated to milliseconds) and a space instead of 'T'. A timestamp
     * without offset is localized in this zone.
     *
     * @param text Timestamp text.
     * @return The instant, or nullopt if the text is not a valid timestamp.
     */
    [[nodiscard]] std::optional<TimePoint> parse(const std::string& text) const;

    /**
     * @brief Formats an instant as ISO-8601 in this zone, with milliseconds
     *        and the zone's UTC offset.
     */
    [[nodiscard]] std::string format(TimePoint timePoint) const;

    /**
     * @brief Formats an instant for people, e.g. "2024-05-01 08:00:00 EDT".
     */
    [[nodiscard]] std::string formatDisplay(TimePoint timePoint) const;

    /**
     * @brief UTC offset of this zone at the given instant.
     */
    [[nodiscard]] std::chrono::seconds offsetAt(TimePoint timePoint) const;

    /**
     * @brief Rounds an instant down to a multiple of @p period on this
     *        zone's wall clock.
     *
     * The offset in effect at @p timePoint is used for the whole grid, so a
     * DST change inside one period shifts that boundary by the DST delta.
     */
    [[nodiscard]] TimePoint alignDown(TimePoint timePoint, std::chrono::minutes period) const;

    [[nodiscard]] QDateTime toDateTime(TimePoint timePoint) const;

private:
    std::string id_;
    QTimeZone zone_;
};

} // namespace uptimegrid::core

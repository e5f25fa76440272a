/**
 * @file Observation.hpp
 * @brief Check outcome, observation and history types.
 *
 * This file defines the result of a single reachability check and the
 * per-target history collection the History Store maintains.
 */

#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace uptimegrid::core {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

/**
 * @brief Outcome of one reachability check.
 */
enum class Outcome : int {
    Up = 1,  ///< Target answered within the timeout
    Down = 2 ///< Target failed, refused, or timed out
};

/**
 * @brief Converts an outcome to its persisted string form.
 * @param outcome The outcome to convert.
 * @return "Up" or "Down".
 */
std::string outcomeToString(Outcome outcome);

/**
 * @brief Parses a persisted outcome, ignoring case.
 * @param str The string to parse (e.g., "Up", "down").
 * @return The outcome, or nullopt if the string names neither state.
 */
std::optional<Outcome> outcomeFromString(const std::string& str);

/**
 * @brief One timestamped check result for a target.
 *
 * Immutable once created. The timestamp is an absolute instant; zone
 * normalization happens before an Observation is constructed.
 */
struct Observation {
    std::string resource;       ///< Address of the checked target
    Outcome outcome{Outcome::Down}; ///< Result of the check
    TimePoint timestamp;        ///< When the check completed

    [[nodiscard]] bool isUp() const { return outcome == Outcome::Up; }

    bool operator==(const Observation& other) const = default;
};

/**
 * @brief Observations keyed by target address.
 *
 * The order inside each vector carries no meaning on input; the History Store
 * emits each vector sorted by timestamp.
 */
using History = std::map<std::string, std::vector<Observation>>;

/**
 * @brief Groups a flat list of observations by resource.
 * @param observations Observations in any order.
 * @return History with the observations appended in input order.
 */
History groupByResource(const std::vector<Observation>& observations);

/**
 * @brief Total number of observations across all targets.
 */
std::size_t observationCount(const History& history);

} // namespace uptimegrid::core

/**
 * @file IProbeService.hpp
 * @brief Interface for one-shot reachability checks.
 *
 * This file defines the abstract interface the Probe Runner uses to check a
 * single target. Implementations exist for HTTP GET and ICMP echo.
 */

#pragma once

#include "core/types/Observation.hpp"

#include <chrono>
#include <string>

namespace uptimegrid::core {

/**
 * @brief Result of a single reachability check.
 */
struct ProbeResult {
    Outcome outcome{Outcome::Down}; ///< Up if the target answered in time
    TimePoint timestamp;            ///< When the check completed
    std::string detail;             ///< Status code or error description

    [[nodiscard]] bool isUp() const { return outcome == Outcome::Up; }
};

/**
 * @brief Interface for a reachability probe.
 *
 * A probe never throws for network conditions and never blocks longer than
 * the timeout (plus a small scheduling grace): failures and timeouts come
 * back as Outcome::Down.
 */
class IProbeService {
public:
    virtual ~IProbeService() = default;

    /**
     * @brief Checks one address.
     * @param address Hostname, IP address or URL, as configured.
     * @param timeout Hard upper bound on the check.
     * @return The outcome, stamped when the check finished.
     */
    virtual ProbeResult probe(const std::string& address, std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Short name used in log lines (e.g., "http", "icmp").
     */
    virtual std::string name() const = 0;
};

} // namespace uptimegrid::core

/**
 * @file Target.hpp
 * @brief Monitored target definition and resource name sanitization.
 *
 * This file defines the Target structure which represents one monitored
 * network endpoint, and the sanitization rule that derives filesystem-safe
 * artifact names from a target address.
 */

#pragma once

#include <string>

namespace uptimegrid::core {

/**
 * @brief Represents a monitored network endpoint.
 *
 * Identity is the raw address string; the display name is cosmetic and may
 * change between runs without affecting stored history.
 */
struct Target {
    std::string address;     ///< Hostname, IP address or URL to check
    std::string displayName; ///< Human-readable name shown on the status page

    /**
     * @brief Validates the target.
     * @return True if the address is non-empty.
     */
    [[nodiscard]] bool isValid() const;

    /**
     * @brief Returns the filesystem-safe name derived from the address.
     * @return Sanitized address (see sanitizeResourceName()).
     */
    [[nodiscard]] std::string sanitizedName() const;

    bool operator==(const Target& other) const = default;
};

/**
 * @brief Replaces every non-alphanumeric character of a resource with '_'.
 *
 * History keys and rendered file names must agree on this mapping, so it is
 * the single place where artifact names are derived.
 *
 * @param resource The target address.
 * @return Sanitized name, same length as the input.
 */
std::string sanitizeResourceName(const std::string& resource);

} // namespace uptimegrid::core

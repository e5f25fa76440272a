/**
 * @file Failure.hpp
 * @brief Failure taxonomy shared by all components.
 *
 * Every failure except an operator misconfiguration degrades to a documented
 * fallback and is only logged. Log lines carry the kind name so runs can be
 * diagnosed after the fact.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace uptimegrid::core {

enum class FailureKind : int {
    ConfigurationMissing = 0, ///< Target or config file absent/empty; defaults used
    StoreUnreadable = 1,      ///< History or archive missing/malformed; starts empty
    ProbeFailure = 2,         ///< Network error or timeout; recorded as Down
    PersistFailure = 3,       ///< An output file could not be written
    Misconfiguration = 4      ///< Operator error; the run stops early
};

std::string failureKindToString(FailureKind kind);

/**
 * @brief Raised for operator misconfiguration, the only fatal condition.
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace uptimegrid::core

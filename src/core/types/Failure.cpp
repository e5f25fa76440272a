#include "core/types/Failure.hpp"

namespace uptimegrid::core {

std::string failureKindToString(FailureKind kind) {
    switch (kind) {
    case FailureKind::ConfigurationMissing:
        return "ConfigurationMissing";
    case FailureKind::StoreUnreadable:
        return "StoreUnreadable";
    case FailureKind::ProbeFailure:
        return "ProbeFailure";
    case FailureKind::PersistFailure:
        return "PersistFailure";
    case FailureKind::Misconfiguration:
        return "Misconfiguration";
    }
    return "Unknown";
}

} // namespace uptimegrid::core

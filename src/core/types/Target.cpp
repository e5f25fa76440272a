#include "core/types/Target.hpp"

#include <cctype>

namespace uptimegrid::core {

bool Target::isValid() const {
    return !address.empty();
}

std::string Target::sanitizedName() const {
    return sanitizeResourceName(address);
}

std::string sanitizeResourceName(const std::string& resource) {
    std::string sanitized;
    sanitized.reserve(resource.size());
    for (unsigned char c : resource) {
        sanitized.push_back(std::isalnum(c) ? static_cast<char>(c) : '_');
    }
    return sanitized;
}

} // namespace uptimegrid::core

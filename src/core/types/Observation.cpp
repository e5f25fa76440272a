#include "core/types/Observation.hpp"

#include <algorithm>
#include <cctype>

namespace uptimegrid::core {

std::string outcomeToString(Outcome outcome) {
    switch (outcome) {
    case Outcome::Up:
        return "Up";
    case Outcome::Down:
        return "Down";
    }
    return "Down";
}

std::optional<Outcome> outcomeFromString(const std::string& str) {
    std::string lower(str);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "up")
        return Outcome::Up;
    if (lower == "down")
        return Outcome::Down;
    return std::nullopt;
}

History groupByResource(const std::vector<Observation>& observations) {
    History history;
    for (const auto& observation : observations) {
        history[observation.resource].push_back(observation);
    }
    return history;
}

std::size_t observationCount(const History& history) {
    std::size_t count = 0;
    for (const auto& [resource, observations] : history) {
        count += observations.size();
    }
    return count;
}

} // namespace uptimegrid::core

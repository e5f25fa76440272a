#include "infrastructure/storage/HistoryFile.hpp"

#include "core/types/Failure.hpp"
#include "infrastructure/storage/AtomicFile.hpp"

#include <algorithm>
#include <fstream>
#include <initializer_list>

namespace uptimegrid::infra {

namespace {

using json = nlohmann::json;

std::optional<std::string> stringField(const json& record,
                                       std::initializer_list<const char*> names) {
    for (const char* name : names) {
        auto it = record.find(name);
        if (it != record.end() && it->is_string()) {
            return it->get<std::string>();
        }
    }
    return std::nullopt;
}

const std::string& storeUnreadable() {
    static const std::string name =
        core::failureKindToString(core::FailureKind::StoreUnreadable);
    return name;
}

} // namespace

HistoryFile::HistoryFile(const core::ReferenceZone& zone, core::LoggerPtr logger)
    : zone_(zone), logger_(std::move(logger)) {}

json HistoryFile::encode(const core::Observation& observation) const {
    return {{"resource", observation.resource},
            {"status", core::outcomeToString(observation.outcome)},
            {"timestamp", zone_.format(observation.timestamp)}};
}

std::optional<core::Observation> HistoryFile::decode(const json& record,
                                                     std::size_t index) const {
    if (!record.is_object()) {
        logger_->warn("Skipping history record #{}: not an object", index);
        return std::nullopt;
    }

    auto resource = stringField(record, {"resource", "target"});
    auto status = stringField(record, {"status", "outcome"});
    auto timestamp = stringField(record, {"timestamp"});
    if (!resource || resource->empty() || !status || !timestamp) {
        logger_->warn("Skipping history record #{}: missing resource, status or timestamp",
                      index);
        return std::nullopt;
    }

    auto outcome = core::outcomeFromString(*status);
    if (!outcome) {
        logger_->warn("Skipping history record #{} for {}: unknown status '{}'", index,
                      *resource, *status);
        return std::nullopt;
    }

    auto instant = zone_.parse(*timestamp);
    if (!instant) {
        logger_->warn("Skipping history record #{} for {}: malformed timestamp '{}'", index,
                      *resource, *timestamp);
        return std::nullopt;
    }

    core::Observation observation;
    observation.resource = *resource;
    observation.outcome = *outcome;
    observation.timestamp = *instant;
    return observation;
}

std::optional<json> HistoryFile::readDocument(const std::filesystem::path& path) const {
    if (!std::filesystem::exists(path)) {
        logger_->info("[{}] '{}' not found. Starting fresh.", storeUnreadable(), path.string());
        return json::array();
    }

    json document;
    try {
        std::ifstream file(path);
        if (!file) {
            logger_->error("[{}] Could not open '{}'. Starting fresh.", storeUnreadable(),
                           path.string());
            return std::nullopt;
        }
        file >> document;
    } catch (const std::exception& e) {
        logger_->error("[{}] Could not read or parse '{}': {}. Starting fresh.",
                       storeUnreadable(), path.string(), e.what());
        return std::nullopt;
    }

    if (!document.is_array()) {
        logger_->error("[{}] '{}' does not hold a JSON array. Starting fresh.", storeUnreadable(),
                       path.string());
        return std::nullopt;
    }
    return document;
}

std::optional<std::vector<core::Observation>> HistoryFile::readRecords(
    const std::filesystem::path& path) const {
    auto document = readDocument(path);
    if (!document) {
        return std::nullopt;
    }

    std::vector<core::Observation> observations;
    observations.reserve(document->size());
    for (std::size_t i = 0; i < document->size(); ++i) {
        if (auto observation = decode((*document)[i], i)) {
            observations.push_back(std::move(*observation));
        }
    }

    if (observations.size() != document->size()) {
        logger_->warn("Loaded {} of {} records from '{}'", observations.size(), document->size(),
                      path.string());
    } else {
        logger_->info("Loaded {} records from '{}'", observations.size(), path.string());
    }
    return observations;
}

bool HistoryFile::writeRecords(const std::filesystem::path& path,
                               std::vector<core::Observation> observations,
                               json document) const {
    std::stable_sort(observations.begin(), observations.end(),
                     [](const core::Observation& a, const core::Observation& b) {
                         return a.timestamp < b.timestamp;
                     });

    for (const auto& observation : observations) {
        document.push_back(encode(observation));
    }

    if (!writeAtomically(path, document.dump(2), logger_)) {
        return false;
    }
    logger_->info("Saved {} data points to '{}'", document.size(), path.string());
    return true;
}

core::History HistoryFile::load(const std::filesystem::path& path) const {
    return core::groupByResource(readRecords(path).value_or(std::vector<core::Observation>{}));
}

bool HistoryFile::save(const std::filesystem::path& path, const core::History& history) const {
    std::vector<core::Observation> observations;
    observations.reserve(core::observationCount(history));
    for (const auto& [resource, entries] : history) {
        observations.insert(observations.end(), entries.begin(), entries.end());
    }
    return writeRecords(path, std::move(observations), json::array());
}

bool HistoryFile::appendToArchive(const std::filesystem::path& path,
                                  const std::vector<core::Observation>& expired) const {
    if (expired.empty()) {
        logger_->debug("Nothing to archive");
        return true;
    }

    auto document = readDocument(path);
    if (!document) {
        logger_->error("[{}] Leaving unreadable archive '{}' untouched; {} expired records dropped",
                       core::failureKindToString(core::FailureKind::PersistFailure),
                       path.string(), expired.size());
        return false;
    }

    // Records this version cannot decode stay in the archive verbatim, ahead
    // of the sorted ones.
    json kept = json::array();
    std::vector<core::Observation> archived;
    archived.reserve(document->size() + expired.size());
    for (std::size_t i = 0; i < document->size(); ++i) {
        if (auto observation = decode((*document)[i], i)) {
            archived.push_back(std::move(*observation));
        } else {
            kept.push_back((*document)[i]);
        }
    }
    if (!kept.empty()) {
        logger_->warn("Keeping {} undecodable records in archive '{}' as they are", kept.size(),
                      path.string());
    }

    archived.insert(archived.end(), expired.begin(), expired.end());
    if (!writeRecords(path, std::move(archived), std::move(kept))) {
        return false;
    }
    logger_->info("Appended {} records to '{}'", expired.size(), path.string());
    return true;
}

} // namespace uptimegrid::infra

#include "infrastructure/report/StatusPageWriter.hpp"

#include "infrastructure/report/ChartRenderer.hpp"
#include "infrastructure/storage/AtomicFile.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace uptimegrid::infra {

namespace {

const char* const PAGE_HEAD = R"(<!DOCTYPE html>
<html lang="en">
<head>
    <meta charset="UTF-8">
    <meta name="viewport" content="width=device-width, initial-scale=1.0">
    <title>%TITLE%</title>
    <style>
        body { font-family: -apple-system, BlinkMacSystemFont, "Segoe UI", Roboto, "Helvetica Neue", Arial, sans-serif; margin: 2em; background-color: #f8f9fa; color: #212529; }
        h1, h2 { color: #343a40; }
        .service-grid { display: grid; grid-template-columns: repeat(3, 1fr); gap: 1.5em; }
        @media (max-width: 992px) { .service-grid { grid-template-columns: repeat(2, 1fr); } }
        @media (max-width: 768px) { .service-grid { grid-template-columns: 1fr; } }
        .service { background-color: #fff; border: 1px solid #dee2e6; padding: 1.5em; border-radius: 8px; box-shadow: 0 2px 4px rgba(0,0,0,0.1); }
        .service h3 { margin-top: 0; }
        .up { color: #FA4616; font-weight: bold; }
        .down { color: #0021A5; font-weight: bold; }
        .unknown { color: #6c757d; font-weight: bold; }
        img { max-width: 100%; height: auto; border-radius: 4px; margin-top: 1em; }
        .footer { margin-top: 2em; padding-top: 1em; border-top: 1px solid #dee2e6; display: flex; justify-content: space-between; align-items: center; }
        .footer-cell { flex: 1; }
        .footer-cell:first-child { text-align: left; }
        .footer-cell:last-child { text-align: right; }
    </style>
</head>
<body>
)";

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string formatPercent(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << value << '%';
    return oss.str();
}

} // namespace

std::string ServiceStatus::statusText() const {
    return latest ? core::outcomeToString(latest->outcome) : "Unknown";
}

StatusPageWriter::StatusPageWriter(const core::ReferenceZone& zone, core::LoggerPtr logger)
    : zone_(zone), logger_(std::move(logger)) {}

std::string StatusPageWriter::escapeHtml(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    for (char c : text) {
        switch (c) {
        case '&':
            result += "&amp;";
            break;
        case '<':
            result += "&lt;";
            break;
        case '>':
            result += "&gt;";
            break;
        case '"':
            result += "&quot;";
            break;
        case '\'':
            result += "&#39;";
            break;
        default:
            result += c;
        }
    }
    return result;
}

StatusSnapshot StatusPageWriter::summarize(const std::string& title,
                                           const core::History& history,
                                           const std::vector<core::Target>& targets,
                                           const std::vector<core::BucketedSeries>& heatmaps,
                                           core::TimePoint now) {
    StatusSnapshot snapshot;
    snapshot.title = title;
    snapshot.generatedAt = now;

    for (const auto& [resource, observations] : history) {
        for (const auto& observation : observations) {
            if (observation.timestamp > now) {
                continue;
            }
            if (!snapshot.lastChecked || observation.timestamp > *snapshot.lastChecked) {
                snapshot.lastChecked = observation.timestamp;
            }
        }
    }

    for (std::size_t i = 0; i < targets.size(); ++i) {
        ServiceStatus status;
        status.target = targets[i];

        auto it = history.find(targets[i].address);
        if (it != history.end()) {
            for (const auto& observation : it->second) {
                if (observation.timestamp > now) {
                    continue;
                }
                // >= so that the last of equal timestamps wins, as in a bucket
                if (!status.latest || observation.timestamp >= status.latest->timestamp) {
                    status.latest = observation;
                }
            }
        }
        if (i < heatmaps.size() && heatmaps[i].resource == targets[i].address) {
            status.uptimePercent = heatmaps[i].uptimePercent();
        }
        snapshot.services.push_back(std::move(status));
    }
    return snapshot;
}

std::string StatusPageWriter::lastCheckedText(const StatusSnapshot& snapshot) const {
    return zone_.formatDisplay(snapshot.lastChecked.value_or(snapshot.generatedAt));
}

std::string StatusPageWriter::renderHtml(const StatusSnapshot& snapshot,
                                         const std::vector<FooterLink>& footerLinks) const {
    std::string head = PAGE_HEAD;
    const std::string placeholder = "%TITLE%";
    head.replace(head.find(placeholder), placeholder.size(), escapeHtml(snapshot.title));

    std::ostringstream html;
    html << head;
    html << "    <h1>" << escapeHtml(snapshot.title) << "</h1>\n";
    html << "    <h2>Last Checked: " << escapeHtml(lastCheckedText(snapshot)) << "</h2>\n";
    html << "    <div class=\"service-grid\">\n";

    for (const auto& service : snapshot.services) {
        const auto status = service.statusText();
        const auto name = escapeHtml(service.target.displayName);
        html << "        <div class=\"service\">\n";
        html << "            <h3>" << name << "</h3>\n";
        html << "            <p><strong>Status:</strong> <span class=\"" << lowercase(status)
             << "\">" << status << "</span></p>\n";
        html << "            <p><strong>Uptime:</strong> "
             << (service.uptimePercent ? formatPercent(*service.uptimePercent) : "n/a")
             << "</p>\n";
        html << "            <img src=\""
             << escapeHtml(ChartRenderer::heatmapFileName(service.target)) << "\" alt=\""
             << name << " Uptime Chart\">\n";
        html << "        </div>\n";
    }
    html << "    </div>\n";

    if (!footerLinks.empty()) {
        html << "    <div class=\"footer\">\n";
        for (const auto& link : footerLinks) {
            html << "        <div class=\"footer-cell\">\n";
            if (!link.title.empty()) {
                html << "            <h3>" << escapeHtml(link.title) << "</h3>\n";
            }
            html << "            <a href=\"" << escapeHtml(link.url)
                 << "\" target=\"_blank\">" << escapeHtml(link.label) << "</a>\n";
            html << "        </div>\n";
        }
        html << "    </div>\n";
    }

    html << "</body>\n</html>\n";
    return html.str();
}

nlohmann::json StatusPageWriter::renderJson(const StatusSnapshot& snapshot) const {
    nlohmann::json services = nlohmann::json::array();
    for (const auto& service : snapshot.services) {
        nlohmann::json entry;
        entry["name"] = service.target.displayName;
        entry["resource"] = service.target.address;
        entry["status"] = service.statusText();
        entry["last_observation"] =
            service.latest ? nlohmann::json(zone_.format(service.latest->timestamp))
                           : nlohmann::json(nullptr);
        entry["uptime_percent"] = service.uptimePercent
                                      ? nlohmann::json(*service.uptimePercent)
                                      : nlohmann::json(nullptr);
        entry["heatmap"] = ChartRenderer::heatmapFileName(service.target);
        entry["sparkline"] = ChartRenderer::sparklineFileName(service.target);
        services.push_back(std::move(entry));
    }

    nlohmann::json j;
    j["title"] = snapshot.title;
    j["timezone"] = zone_.id();
    j["generated_at"] = zone_.format(snapshot.generatedAt);
    j["last_checked"] = snapshot.lastChecked
                            ? nlohmann::json(zone_.format(*snapshot.lastChecked))
                            : nlohmann::json(nullptr);
    j["services"] = std::move(services);
    return j;
}

bool StatusPageWriter::write(const std::filesystem::path& outputDir,
                             const StatusSnapshot& snapshot,
                             const std::vector<FooterLink>& footerLinks) const {
    bool ok = true;

    auto htmlPath = outputDir / "index.html";
    if (writeAtomically(htmlPath, renderHtml(snapshot, footerLinks), logger_)) {
        logger_->info("Generated HTML report at {}", htmlPath.string());
    } else {
        ok = false;
    }

    auto jsonPath = outputDir / "status.json";
    if (writeAtomically(jsonPath, renderJson(snapshot).dump(2), logger_)) {
        logger_->info("Generated status snapshot at {}", jsonPath.string());
    } else {
        ok = false;
    }
    return ok;
}

} // namespace uptimegrid::infra

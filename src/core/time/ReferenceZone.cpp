#include "core/time/ReferenceZone.hpp"

#include "core/types/Failure.hpp"

namespace uptimegrid::core {

namespace {

int64_t toMSecs(TimePoint timePoint) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(timePoint.time_since_epoch())
        .count();
}

// Qt keeps at most three fractional digits; Python writes six.
QString truncateFraction(const QString& text) {
    int timePos = text.indexOf(QLatin1Char('T'));
    if (timePos < 0) {
        return text;
    }
    int dot = text.indexOf(QLatin1Char('.'), timePos);
    if (dot < 0) {
        return text;
    }

    int end = dot + 1;
    while (end < text.size() && text.at(end).isDigit()) {
        ++end;
    }
    if (end - dot - 1 <= 3) {
        return text;
    }
    return text.left(dot + 4) + text.mid(end);
}

} // namespace

ReferenceZone::ReferenceZone(const std::string& ianaId)
    : id_(ianaId), zone_(QByteArray::fromStdString(ianaId)) {
    if (!zone_.isValid()) {
        throw ConfigurationError("Unknown timezone: " + ianaId);
    }
}

std::optional<TimePoint> ReferenceZone::parse(const std::string& text) const {
    QString normalized = QString::fromStdString(text).trimmed();
    if (normalized.size() < 10) {
        return std::nullopt;
    }
    if (normalized.size() > 10 && normalized.at(10) == QLatin1Char(' ')) {
        normalized[10] = QLatin1Char('T');
    }
    normalized = truncateFraction(normalized);

    QDateTime dateTime = QDateTime::fromString(normalized, Qt::ISODateWithMs);
    if (!dateTime.isValid()) {
        return std::nullopt;
    }

    if (dateTime.timeSpec() == Qt::LocalTime) {
        dateTime = QDateTime(dateTime.date(), dateTime.time(), zone_);
        if (!dateTime.isValid()) {
            return std::nullopt;
        }
    }

    return TimePoint(std::chrono::milliseconds(dateTime.toMSecsSinceEpoch()));
}

std::string ReferenceZone::format(TimePoint timePoint) const {
    return toDateTime(timePoint).toString(Qt::ISODateWithMs).toStdString();
}

std::string ReferenceZone::formatDisplay(TimePoint timePoint) const {
    auto dateTime = toDateTime(timePoint);
    return (dateTime.toString(QStringLiteral("yyyy-MM-dd HH:mm:ss")) + QLatin1Char(' ') +
            dateTime.timeZoneAbbreviation())
        .toStdString();
}

std::chrono::seconds ReferenceZone::offsetAt(TimePoint timePoint) const {
    return std::chrono::seconds(toDateTime(timePoint).offsetFromUtc());
}

TimePoint ReferenceZone::alignDown(TimePoint timePoint, std::chrono::minutes period) const {
    auto offset = offsetAt(timePoint);
    auto local =
        std::chrono::duration_cast<std::chrono::seconds>(timePoint.time_since_epoch()) + offset;
    auto periodSeconds = std::chrono::duration_cast<std::chrono::seconds>(period);

    auto remainder = local % periodSeconds;
    if (remainder.count() < 0) {
        remainder += periodSeconds;
    }
    return TimePoint(local - remainder - offset);
}

QDateTime ReferenceZone::toDateTime(TimePoint timePoint) const {
    return QDateTime::fromMSecsSinceEpoch(toMSecs(timePoint), zone_);
}

} // namespace uptimegrid::core

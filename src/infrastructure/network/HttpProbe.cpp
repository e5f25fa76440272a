#include "infrastructure/network/HttpProbe.hpp"

#include "core/types/Failure.hpp"

#include <QEventLoop>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>
#include <QUrl>

namespace uptimegrid::infra {

namespace {
constexpr auto DEADLINE_GRACE = std::chrono::milliseconds(500);
}

HttpProbe::HttpProbe(core::LoggerPtr logger)
    : manager_(std::make_unique<QNetworkAccessManager>()), logger_(std::move(logger)) {}

HttpProbe::~HttpProbe() = default;

std::string HttpProbe::normalizeUrl(const std::string& address) {
    if (address.rfind("http://", 0) == 0 || address.rfind("https://", 0) == 0) {
        return address;
    }
    return "https://" + address;
}

core::ProbeResult HttpProbe::probe(const std::string& address, std::chrono::milliseconds timeout) {
    const auto url = normalizeUrl(address);

    QNetworkRequest request(QUrl(QString::fromStdString(url)));
    request.setTransferTimeout(static_cast<int>(timeout.count()));
    request.setAttribute(QNetworkRequest::RedirectPolicyAttribute,
                         QNetworkRequest::NoLessSafeRedirectPolicy);
    request.setHeader(QNetworkRequest::UserAgentHeader, QStringLiteral("UptimeGrid/1.0"));

    std::unique_ptr<QNetworkReply> reply(manager_->get(request));

    QEventLoop loop;
    QTimer deadline;
    deadline.setSingleShot(true);
    QObject::connect(reply.get(), &QNetworkReply::finished, &loop, &QEventLoop::quit);
    QObject::connect(&deadline, &QTimer::timeout, &loop, &QEventLoop::quit);
    deadline.start(static_cast<int>((timeout + DEADLINE_GRACE).count()));
    if (!reply->isFinished()) {
        loop.exec();
    }

    core::ProbeResult result;
    result.outcome = core::Outcome::Down;

    if (!reply->isFinished()) {
        reply->abort();
        result.detail = "Deadline exceeded";
    } else {
        int statusCode = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
        if (reply->error() == QNetworkReply::NoError && isSuccessStatus(statusCode)) {
            result.outcome = core::Outcome::Up;
            result.detail = "HTTP " + std::to_string(statusCode);
        } else if (statusCode > 0) {
            result.detail = "HTTP " + std::to_string(statusCode);
        } else {
            result.detail = reply->errorString().toStdString();
        }
    }
    result.timestamp = core::Clock::now();

    if (result.isUp()) {
        logger_->info("Check for {} SUCCEEDED with {}", address, result.detail);
    } else {
        logger_->warn("[{}] Check for {} FAILED: {}",
                      core::failureKindToString(core::FailureKind::ProbeFailure), address,
                      result.detail);
    }
    return result;
}

} // namespace uptimegrid::infra

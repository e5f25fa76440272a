#pragma once

#include "core/Logging.hpp"
#include "core/services/IProbeService.hpp"

#include <QNetworkAccessManager>

#include <memory>
#include <string>

namespace uptimegrid::infra {

/**
 * @brief HTTP GET probe built on Qt's network stack.
 *
 * A 2xx final status (redirects followed) is Up; any other status, transport
 * error or timeout is Down. Requires a QCoreApplication instance; the request
 * runs in a local event loop so probe() is synchronous.
 */
class HttpProbe : public core::IProbeService {
public:
    explicit HttpProbe(core::LoggerPtr logger);
    ~HttpProbe() override;

    core::ProbeResult probe(const std::string& address,
                            std::chrono::milliseconds timeout) override;

    std::string name() const override { return "http"; }

    /**
     * @brief Prepends "https://" to addresses without an http(s) scheme.
     */
    static std::string normalizeUrl(const std::string& address);

    static bool isSuccessStatus(int statusCode) { return statusCode >= 200 && statusCode < 300; }

private:
    std::unique_ptr<QNetworkAccessManager> manager_;
    core::LoggerPtr logger_;
};

} // namespace uptimegrid::infra

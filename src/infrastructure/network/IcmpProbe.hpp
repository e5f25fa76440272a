#pragma once

#include "core/Logging.hpp"
#include "core/services/IProbeService.hpp"
#include "infrastructure/network/ProbeWorkers.hpp"

#include <atomic>
#include <cstdint>
#include <future>
#include <optional>
#include <vector>

namespace uptimegrid::infra {

/**
 * @brief ICMP echo probe for host reachability.
 *
 * Sends one echo request over a raw socket and waits for the matching reply.
 * The socket work runs on the ProbeWorkers pool; probe() waits for it with a
 * deadline, so a stuck resolver or socket cannot hang the run.
 *
 * @note On Linux, requires CAP_NET_RAW capability or root privileges.
 *       Without it every check reports Down with an explanatory detail.
 */
class IcmpProbe : public core::IProbeService {
public:
    /// Prefix that selects this probe for a single target.
    static constexpr const char* kScheme = "icmp://";

    IcmpProbe(ProbeWorkers& workers, core::LoggerPtr logger);

    core::ProbeResult probe(const std::string& address,
                            std::chrono::milliseconds timeout) override;

    std::string name() const override { return "icmp"; }

    /**
     * @brief Starts an echo request on the thread pool.
     * @param address Host name or IPv4 address (an icmp:// prefix is removed).
     * @param timeout Receive timeout of the socket.
     * @return Future holding the result.
     */
    std::future<core::ProbeResult> pingAsync(const std::string& address,
                                             std::chrono::milliseconds timeout);

    static std::string stripScheme(const std::string& address);

    // ICMP helpers
    static uint16_t calculateChecksum(const uint8_t* data, size_t length);
    static std::vector<uint8_t> buildIcmpEchoRequest(uint16_t identifier, uint16_t sequence);

private:
    static core::ProbeResult performPing(const std::string& address,
                                         std::chrono::milliseconds timeout, uint16_t identifier,
                                         uint16_t seq);

    ProbeWorkers& workers_;
    core::LoggerPtr logger_;
    std::atomic<uint16_t> sequenceNumber_{0};
    uint16_t identifier_;
};

} // namespace uptimegrid::infra

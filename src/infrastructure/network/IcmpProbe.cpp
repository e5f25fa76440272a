#include "infrastructure/network/IcmpProbe.hpp"

#include "core/types/Failure.hpp"

#include <array>
#include <cstring>
#include <random>

#ifdef __linux__
#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/ip_icmp.h>
#include <sys/socket.h>
#include <unistd.h>
#endif

namespace uptimegrid::infra {

namespace {

constexpr uint8_t ICMP_ECHO_REQUEST = 8;
constexpr uint8_t ICMP_ECHO_REPLY = 0;
constexpr auto DEADLINE_GRACE = std::chrono::milliseconds(500);

#ifdef __linux__
std::optional<std::string> resolveHostname(const std::string& hostname) {
    struct addrinfo hints {};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_RAW;

    struct addrinfo* result = nullptr;
    if (getaddrinfo(hostname.c_str(), nullptr, &hints, &result) != 0 || result == nullptr) {
        return std::nullopt;
    }

    char ipStr[INET_ADDRSTRLEN];
    auto* addr = reinterpret_cast<struct sockaddr_in*>(result->ai_addr);
    inet_ntop(AF_INET, &addr->sin_addr, ipStr, INET_ADDRSTRLEN);
    freeaddrinfo(result);

    return std::string(ipStr);
}
#endif

core::ProbeResult downResult(std::string detail) {
    core::ProbeResult result;
    result.outcome = core::Outcome::Down;
    result.timestamp = core::Clock::now();
    result.detail = std::move(detail);
    return result;
}

} // namespace

IcmpProbe::IcmpProbe(ProbeWorkers& workers, core::LoggerPtr logger)
    : workers_(workers), logger_(std::move(logger)) {
    std::random_device rd;
    identifier_ = static_cast<uint16_t>(rd() & 0xFFFF);
    logger_->debug("IcmpProbe initialized with identifier: {}", identifier_);
}

std::string IcmpProbe::stripScheme(const std::string& address) {
    const std::string scheme(kScheme);
    if (address.rfind(scheme, 0) == 0) {
        return address.substr(scheme.size());
    }
    return address;
}

uint16_t IcmpProbe::calculateChecksum(const uint8_t* data, size_t length) {
    uint32_t sum = 0;

    while (length > 1) {
        sum += (static_cast<uint16_t>(data[0]) << 8) | data[1];
        data += 2;
        length -= 2;
    }

    if (length == 1) {
        sum += static_cast<uint16_t>(data[0]) << 8;
    }

    while (sum >> 16) {
        sum = (sum & 0xFFFF) + (sum >> 16);
    }

    return static_cast<uint16_t>(~sum);
}

std::vector<uint8_t> IcmpProbe::buildIcmpEchoRequest(uint16_t identifier, uint16_t sequence) {
    std::vector<uint8_t> packet(64, 0);

    packet[0] = ICMP_ECHO_REQUEST; // Type
    packet[1] = 0;                 // Code
    packet[4] = static_cast<uint8_t>(identifier >> 8);
    packet[5] = static_cast<uint8_t>(identifier & 0xFF);
    packet[6] = static_cast<uint8_t>(sequence >> 8);
    packet[7] = static_cast<uint8_t>(sequence & 0xFF);

    auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    std::memcpy(&packet[8], &now, sizeof(now));

    uint16_t checksum = calculateChecksum(packet.data(), packet.size());
    packet[2] = static_cast<uint8_t>(checksum >> 8);
    packet[3] = static_cast<uint8_t>(checksum & 0xFF);

    return packet;
}

core::ProbeResult IcmpProbe::performPing(const std::string& address,
                                         std::chrono::milliseconds timeout, uint16_t identifier,
                                         uint16_t seq) {
#ifdef __linux__
    auto resolved = resolveHostname(address);
    if (!resolved) {
        return downResult("Could not resolve " + address);
    }

    int sock = socket(AF_INET, SOCK_RAW, IPPROTO_ICMP);
    if (sock < 0) {
        return downResult("Failed to create raw socket (need CAP_NET_RAW)");
    }

    struct timeval tv {};
    tv.tv_sec = timeout.count() / 1000;
    tv.tv_usec = (timeout.count() % 1000) * 1000;
    setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    struct sockaddr_in dest {};
    dest.sin_family = AF_INET;
    inet_pton(AF_INET, resolved->c_str(), &dest.sin_addr);

    auto packet = buildIcmpEchoRequest(identifier, seq);

    ssize_t sent = sendto(sock, packet.data(), packet.size(), 0,
                          reinterpret_cast<struct sockaddr*>(&dest), sizeof(dest));
    if (sent < 0) {
        close(sock);
        return downResult("Failed to send ICMP packet");
    }

    // The raw socket sees every ICMP packet on the host; skip foreign replies
    // until ours arrives or the deadline passes.
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::array<uint8_t, 1024> recvBuffer{};
    while (std::chrono::steady_clock::now() < deadline) {
        struct sockaddr_in from {};
        socklen_t fromLen = sizeof(from);
        ssize_t received = recvfrom(sock, recvBuffer.data(), recvBuffer.size(), 0,
                                    reinterpret_cast<struct sockaddr*>(&from), &fromLen);
        if (received < 0) {
            break;
        }
        if (received < 28) { // Minimum IP header (20) + ICMP header (8)
            continue;
        }

        auto* ipHeader = recvBuffer.data();
        size_t ipHeaderLen = static_cast<size_t>((ipHeader[0] & 0x0F) * 4);
        if (ipHeaderLen + 8 > static_cast<size_t>(received)) {
            continue;
        }
        auto* icmpHeader = recvBuffer.data() + ipHeaderLen;
        if (icmpHeader[0] != ICMP_ECHO_REPLY) {
            continue;
        }

        uint16_t recvId = (static_cast<uint16_t>(icmpHeader[4]) << 8) | icmpHeader[5];
        uint16_t recvSeq = (static_cast<uint16_t>(icmpHeader[6]) << 8) | icmpHeader[7];
        if (recvId == identifier && recvSeq == seq) {
            close(sock);
            core::ProbeResult result;
            result.outcome = core::Outcome::Up;
            result.timestamp = core::Clock::now();
            result.detail = "echo reply TTL=" + std::to_string(ipHeader[8]);
            return result;
        }
    }

    close(sock);
    return downResult("Timeout or receive error");
#else
    (void)timeout;
    (void)identifier;
    (void)seq;
    return downResult("ICMP ping not implemented for this platform: " + address);
#endif
}

std::future<core::ProbeResult> IcmpProbe::pingAsync(const std::string& address,
                                                    std::chrono::milliseconds timeout) {
    auto host = stripScheme(address);
    uint16_t identifier = identifier_;
    uint16_t seq = sequenceNumber_++;
    return workers_.submit([host, timeout, identifier, seq]() {
        try {
            return performPing(host, timeout, identifier, seq);
        } catch (const std::exception& e) {
            return downResult(e.what());
        }
    });
}

core::ProbeResult IcmpProbe::probe(const std::string& address,
                                   std::chrono::milliseconds timeout) {
    auto future = pingAsync(address, timeout);
    if (future.wait_for(timeout + DEADLINE_GRACE) != std::future_status::ready) {
        logger_->warn("[{}] ICMP check of {} exceeded its {}ms deadline",
                      core::failureKindToString(core::FailureKind::ProbeFailure), address,
                      timeout.count());
        return downResult("Deadline exceeded");
    }

    auto result = future.get();
    if (!result.isUp()) {
        logger_->warn("[{}] ICMP check of {} failed: {}",
                      core::failureKindToString(core::FailureKind::ProbeFailure), address,
                      result.detail);
    } else {
        logger_->debug("ICMP check of {} succeeded: {}", address, result.detail);
    }
    return result;
}

} // namespace uptimegrid::infra

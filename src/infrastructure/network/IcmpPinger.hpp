#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace connmon::infra {

/**
 * @brief Outcome of one ICMP echo exchange.
 */
struct IcmpReply {
    bool success{false};
    std::optional<double> latencyMs;
    std::optional<int> ttl;
    std::string errorMessage;
};

/**
 * @brief Sends single ICMP echo requests and waits for the matching reply.
 *
 * Uses a raw socket when permitted and falls back to an unprivileged
 * SOCK_DGRAM ICMP socket (net.ipv4.ping_group_range) otherwise.
 *
 * @note IPv4 only. On Linux raw sockets require CAP_NET_RAW.
 */
class IcmpPinger {
public:
    IcmpPinger();

    /**
     * @brief Sends exactly one echo request and waits for its reply.
     * @param address IPv4 address to ping.
     * @param timeout Maximum time to wait for the reply.
     */
    IcmpReply ping(const std::string& address, std::chrono::milliseconds timeout);

    static uint16_t calculateChecksum(const uint8_t* data, size_t length);
    static std::vector<uint8_t> buildEchoRequest(uint16_t identifier, uint16_t sequence);

private:
    std::atomic<uint16_t> sequenceNumber_{0};
    uint16_t identifier_;
};

} // namespace connmon::infra

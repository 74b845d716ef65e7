#pragma once

#include "core/services/IProber.hpp"
#include "infrastructure/network/IcmpPinger.hpp"

#include <chrono>
#include <map>

namespace connmon::infra {

/**
 * @brief Timeouts applied to every probe.
 */
struct ProberOptions {
    std::chrono::milliseconds connectTimeout{5000}; ///< TCP/UDP connect and composite budget
    std::chrono::milliseconds pingTimeout{2000};    ///< Single ICMP echo
};

/**
 * @brief Executes TCP, UDP, ICMP and composite connectivity checks.
 *
 * Each call runs its sockets on a private io_context and returns once the
 * check finished or its timeout expired, so the calling worker thread is
 * blocked for a bounded time only. No call ever throws.
 *
 * @note UDP "connected" only means the local connect() call succeeded. UDP
 *       has no handshake, so this does not prove that the remote port listens.
 */
class Prober : public core::IProber {
public:
    explicit Prober(ProberOptions options = {});

    core::ProbeResult probe(const std::string& resolvedIp, const core::Target& target) override;

    core::ProbeResult probeTcp(const std::string& ip, uint16_t port);
    core::ProbeResult probeUdp(const std::string& ip, uint16_t port);
    core::ProbeResult probeIcmp(const std::string& ip);

    /**
     * @brief Connects to every port concurrently and summarizes the outcome.
     */
    core::ProbeResult probeComposite(const std::string& ip, const core::PortServiceMap& ports);

    /**
     * @brief Folds per-port outcomes into one composite result.
     *
     * connected is true iff every port connected; latency is the mean of the
     * successful ports' latencies, or 0 when none succeeded.
     */
    static core::ProbeResult summarizeComposite(std::map<uint16_t, core::PortProbeResult> perPort);

    const ProberOptions& options() const { return options_; }

private:
    std::map<uint16_t, core::PortProbeResult> connectAll(const std::string& ip,
                                                         const core::PortServiceMap& ports);

    ProberOptions options_;
    IcmpPinger pinger_;
};

} // namespace connmon::infra

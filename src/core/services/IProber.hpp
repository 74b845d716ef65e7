/**
 * @file IProber.hpp
 * @brief Interface for executing one connectivity check.
 */

#pragma once

#include "core/types/ProbeResult.hpp"
#include "core/types/Target.hpp"

#include <string>

namespace connmon::core {

/**
 * @brief Interface for connectivity probes.
 *
 * Implementations never throw: every error or timeout is reported as a
 * ProbeResult with connected set to false.
 */
class IProber {
public:
    virtual ~IProber() = default;

    /**
     * @brief Probes a target at an already resolved address.
     * @param resolvedIp IP address to probe.
     * @param target Target describing protocol and port(s).
     * @return Result of the check, bounded by the prober's timeouts.
     */
    virtual ProbeResult probe(const std::string& resolvedIp, const Target& target) = 0;
};

} // namespace connmon::core

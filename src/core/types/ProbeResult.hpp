/**
 * @file ProbeResult.hpp
 * @brief Result of a single connectivity probe.
 *
 * A ProbeResult is produced fresh on every poll and replaced wholesale; it is
 * never mutated after it has been handed to observers.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace connmon::core {

/**
 * @brief Outcome of probing one port of a composite target.
 */
struct PortProbeResult {
    std::string service;              ///< Service name for the port (e.g. "LDAP")
    bool connected{false};            ///< Whether the TCP connect succeeded
    std::optional<double> latencyMs;  ///< Connect latency, rounded to 2 decimals

    bool operator==(const PortProbeResult& other) const = default;
};

/**
 * @brief Result of a single connectivity check.
 */
struct ProbeResult {
    bool connected{false};                 ///< Whether the target answered
    std::optional<double> latencyMs;       ///< Latency in ms (2 decimals), null on failure
    std::optional<std::string> resolvedIp; ///< IP the probe was sent to
    std::optional<std::string> macAddress; ///< Best-effort MAC address of the target
    std::optional<std::map<uint16_t, PortProbeResult>> perPort; ///< Composite breakdown
    std::string errorMessage;              ///< Reason for failure, empty on success
    std::chrono::system_clock::time_point timestamp; ///< When the probe finished

    /**
     * @brief Creates a failed result carrying an error description.
     */
    static ProbeResult failure(std::string error);

    bool operator==(const ProbeResult& other) const = default;
};

/**
 * @brief Rounds a latency value to two decimal places.
 */
double roundLatency(double ms);

/**
 * @brief Converts a measured duration to milliseconds rounded to two decimals.
 */
double toLatencyMs(std::chrono::steady_clock::duration elapsed);

} // namespace connmon::core

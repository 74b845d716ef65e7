/**
 * @file IResolver.hpp
 * @brief Interface for hostname resolution.
 */

#pragma once

#include <optional>
#include <string>

namespace connmon::core {

/**
 * @brief Interface for resolving hostnames to IP addresses.
 */
class IResolver {
public:
    virtual ~IResolver() = default;

    /**
     * @brief Resolves a hostname to an IP address.
     *
     * IP literals are returned unchanged without any network traffic.
     *
     * @param hostname Hostname or IP literal.
     * @return The first resolved address, or nullopt on resolution failure.
     */
    virtual std::optional<std::string> resolve(const std::string& hostname) = 0;
};

} // namespace connmon::core

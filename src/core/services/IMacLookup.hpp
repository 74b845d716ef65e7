#pragma once

#include <optional>
#include <string>

namespace connmon::core {

/**
 * @brief Best-effort lookup of a MAC address for an IP on the local segment.
 */
class IMacLookup {
public:
    virtual ~IMacLookup() = default;

    /**
     * @brief Looks up the MAC address of an IP.
     * @return Upper-case colon separated MAC, or nullopt if unknown.
     */
    virtual std::optional<std::string> lookup(const std::string& ip) = 0;
};

} // namespace connmon::core

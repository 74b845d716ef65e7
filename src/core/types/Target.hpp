/**
 * @file Target.hpp
 * @brief Monitored target definition, protocols, and composite port sets.
 *
 * This file defines the Target structure which represents one reachability
 * check (host + protocol + port) and the composite kinds that expand into
 * several concrete TCP checks.
 */

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace connmon::core {

/**
 * @brief Kind of connectivity check performed for a target.
 */
enum class Protocol : int {
    Tcp = 0,      ///< TCP connect to a port
    Udp = 1,      ///< UDP connect (local only, no handshake)
    Icmp = 2,     ///< Single ICMP echo request
    Composite = 3 ///< Set of TCP ports that must all answer
};

/**
 * @brief Predefined composite port sets.
 */
enum class CompositeKind : int {
    AdDc = 0, ///< Active Directory domain controller
    Rpc = 1   ///< RPC / portmapper services
};

/**
 * @brief Ordered map of port number to service name.
 */
using PortServiceMap = std::map<uint16_t, std::string>;

/**
 * @brief One concrete (or composite) reachability check.
 *
 * Targets are immutable once materialized by the registry; a reconfiguration
 * replaces them wholesale.
 */
struct Target {
    std::string host;                        ///< Hostname or IP literal to check
    Protocol protocol{Protocol::Tcp};        ///< Check performed on every tick
    std::optional<uint16_t> port;            ///< Required for TCP and UDP only
    std::string deviceName;                  ///< Human-readable device name
    std::optional<std::string> alertGroup;   ///< Notify group, alerts disabled if empty
    int alertDelayMinutes{15};               ///< Debounce before an alert fires (1-60)
    std::optional<CompositeKind> compositeKind; ///< Kind for Composite targets
    std::optional<CompositeKind> memberOf;   ///< Set on TCP targets expanded from a composite
    PortServiceMap compositePorts;           ///< Ports probed by an unexpanded composite

    /**
     * @brief Validates the target against its protocol's requirements.
     * @return Empty string when valid, otherwise a description of the problem.
     */
    [[nodiscard]] std::string validate() const;

    /**
     * @brief Returns the stable identity key `<host>_<PROTOCOL>_<port|ping>`.
     */
    [[nodiscard]] std::string identityKey() const;

    /**
     * @brief Returns the display name, e.g. "ICMP (Ping)" or "TCP 22".
     */
    [[nodiscard]] std::string displayName() const;

    /**
     * @brief Returns the protocol label used in identity keys and attributes.
     *
     * Composite targets report their kind ("AD_DC", "RPC") instead of "COMPOSITE".
     */
    [[nodiscard]] std::string protocolLabel() const;

    bool operator==(const Target& other) const = default;
};

/**
 * @brief Converts a protocol to its configuration string ("TCP", "UDP", ...).
 */
std::string protocolToString(Protocol protocol);

/**
 * @brief Converts a composite kind to its configuration string ("AD_DC", "RPC").
 */
std::string compositeKindToString(CompositeKind kind);

/**
 * @brief Parses a composite kind name.
 * @return The kind, or nullopt if the name is not a known composite.
 */
std::optional<CompositeKind> compositeKindFromString(const std::string& str);

/**
 * @brief Lookup of the built-in composite port sets.
 */
class CompositePorts {
public:
    /**
     * @brief Gets the fixed port to service map for a composite kind.
     */
    static const PortServiceMap& forKind(CompositeKind kind);

    /**
     * @brief Names a port using the kind's map, falling back to "TCP <port>".
     */
    static std::string serviceName(CompositeKind kind, uint16_t port);
};

} // namespace connmon::core

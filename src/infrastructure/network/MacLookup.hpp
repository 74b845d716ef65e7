#pragma once

#include "core/services/IMacLookup.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace connmon::infra {

/**
 * @brief Reads MAC addresses from the local neighbour table.
 *
 * The kernel table (/proc/net/arp) is consulted first, then `ip neigh` and
 * `arp -n`, executed without a shell. If the address is still unknown, a
 * short TCP connect to port 80 is made to get the kernel to resolve the
 * neighbour, and the table is read again. Only hosts on the local segment
 * ever have an entry.
 */
class MacLookup : public core::IMacLookup {
public:
    explicit MacLookup(std::chrono::milliseconds pokeTimeout = std::chrono::milliseconds(1000));

    std::optional<std::string> lookup(const std::string& ip) override;

    /**
     * @brief Finds the MAC of an IP in /proc/net/arp formatted text.
     */
    static std::optional<std::string> parseProcArp(const std::string& content,
                                                   const std::string& ip);

    /**
     * @brief Extracts the first MAC address from command output.
     */
    static std::optional<std::string> parseCommandOutput(const std::string& output);

    /**
     * @brief Normalizes a MAC to upper case with ':' separators.
     * @return nullopt for malformed or all-zero (incomplete) entries.
     */
    static std::optional<std::string> normalize(const std::string& mac);

    /**
     * @brief Validates an address literal and rewrites it in canonical form.
     * @return nullopt for anything that is not a plain IPv4/IPv6 address,
     *         including scoped IPv6 addresses ("fe80::1%eth0").
     */
    static std::optional<std::string> canonicalAddress(const std::string& ip);

private:
    std::optional<std::string> readNeighbourTable(const std::string& ip);
    /**
     * @brief Runs a program directly (no shell) and captures its stdout.
     */
    std::optional<std::string> runCommand(const std::vector<std::string>& args);
    void poke(const std::string& ip);

    std::chrono::milliseconds pokeTimeout_;
};

} // namespace connmon::infra

#pragma once

#include "core/services/IResolver.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace connmon::infra {

/**
 * @brief Settings of the upstream DNS server.
 */
struct DnsResolverOptions {
    std::string server{"1.1.1.1"};               ///< IPv4 address of the DNS server
    uint16_t port{53};                           ///< DNS server port
    std::chrono::milliseconds queryTimeout{2000}; ///< Timeout of one query
    std::chrono::milliseconds lifetime{4000};     ///< Total time budget incl. retries
};

/**
 * @brief Resolves hostnames with an "A" query against a configured DNS server.
 *
 * Unlike getaddrinfo() this bypasses the system resolver so every target is
 * resolved through the same upstream server. Queries are sent over UDP on a
 * private io_context, so resolve() blocks the calling worker thread for at
 * most the configured lifetime.
 */
class DnsResolver : public core::IResolver {
public:
    explicit DnsResolver(DnsResolverOptions options);

    /**
     * @brief Resolves a hostname, returning IP literals unchanged.
     * @param hostname Hostname or IPv4/IPv6 literal.
     * @return First A record, or nullopt on any DNS failure.
     */
    std::optional<std::string> resolve(const std::string& hostname) override;

    /**
     * @brief Number of DNS queries put on the wire since construction.
     */
    uint64_t queriesSent() const { return queriesSent_.load(); }

    const DnsResolverOptions& options() const { return options_; }

    /**
     * @brief Checks whether a string is an IPv4 or IPv6 literal.
     */
    static bool isIpLiteral(const std::string& value);

    /**
     * @brief Encodes a recursive A/IN query for a name.
     * @throws std::invalid_argument if a label is empty or longer than 63 bytes.
     */
    static std::vector<uint8_t> buildQuery(uint16_t id, const std::string& qname);

    /**
     * @brief Extracts the first A record from a DNS response.
     * @param data Response bytes.
     * @param expectedId Transaction id of the query.
     * @param error Receives a description when no address could be extracted.
     * @return Dotted-quad address or nullopt.
     */
    static std::optional<std::string> parseFirstARecord(const std::vector<uint8_t>& data,
                                                        uint16_t expectedId, std::string& error);

private:
    /**
     * @brief Sends one query and waits for the reply carrying its id.
     */
    std::optional<std::vector<uint8_t>> exchange(const std::vector<uint8_t>& query,
                                                 uint16_t expectedId,
                                                 std::chrono::milliseconds timeout,
                                                 std::string& error);

    DnsResolverOptions options_;
    std::atomic<uint64_t> queriesSent_{0};
};

} // namespace connmon::infra

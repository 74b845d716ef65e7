#include "infrastructure/network/DnsResolver.hpp"

#include <asio.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <functional>
#include <random>
#include <stdexcept>

namespace connmon::infra {

namespace {

constexpr size_t DNS_HEADER_SIZE = 12;
constexpr uint16_t TYPE_A = 1;
constexpr uint16_t CLASS_IN = 1;

uint16_t makeQueryId() {
    static thread_local std::mt19937 rng{std::random_device{}()};
    return static_cast<uint16_t>(rng());
}

uint16_t readU16(const std::vector<uint8_t>& data, size_t offset) {
    return static_cast<uint16_t>((data[offset] << 8) | data[offset + 1]);
}

// Advances past an encoded name (labels and/or a compression pointer).
bool skipName(const std::vector<uint8_t>& data, size_t& offset) {
    while (offset < data.size()) {
        uint8_t len = data[offset];
        if ((len & 0xC0) == 0xC0) {
            offset += 2;
            return offset <= data.size();
        }
        if (len == 0) {
            offset += 1;
            return true;
        }
        offset += 1 + len;
    }
    return false;
}

} // namespace

DnsResolver::DnsResolver(DnsResolverOptions options) : options_(std::move(options)) {
    spdlog::debug("DNS resolver using server {}:{}", options_.server, options_.port);
}

bool DnsResolver::isIpLiteral(const std::string& value) {
    asio::error_code ec;
    asio::ip::make_address(value, ec);
    return !ec;
}

std::vector<uint8_t> DnsResolver::buildQuery(uint16_t id, const std::string& qname) {
    std::vector<uint8_t> packet(DNS_HEADER_SIZE, 0);
    packet[0] = static_cast<uint8_t>(id >> 8);
    packet[1] = static_cast<uint8_t>(id & 0xFF);
    packet[2] = 0x01; // recursion desired
    packet[5] = 0x01; // QDCOUNT = 1

    std::string name = qname;
    if (!name.empty() && name.back() == '.') {
        name.pop_back();
    }

    size_t start = 0;
    while (start <= name.size()) {
        size_t dot = name.find('.', start);
        if (dot == std::string::npos) {
            dot = name.size();
        }
        size_t len = dot - start;
        if (len == 0 || len > 63) {
            throw std::invalid_argument("invalid DNS label in '" + qname + "'");
        }
        packet.push_back(static_cast<uint8_t>(len));
        packet.insert(packet.end(), name.begin() + static_cast<std::ptrdiff_t>(start),
                      name.begin() + static_cast<std::ptrdiff_t>(dot));
        start = dot + 1;
    }
    packet.push_back(0);

    packet.push_back(0);
    packet.push_back(TYPE_A);
    packet.push_back(0);
    packet.push_back(CLASS_IN);
    return packet;
}

std::optional<std::string> DnsResolver::parseFirstARecord(const std::vector<uint8_t>& data,
                                                          uint16_t expectedId,
                                                          std::string& error) {
    if (data.size() < DNS_HEADER_SIZE) {
        error = "short response";
        return std::nullopt;
    }
    if (readU16(data, 0) != expectedId) {
        error = "transaction id mismatch";
        return std::nullopt;
    }
    if ((data[2] & 0x80) == 0) {
        error = "not a response";
        return std::nullopt;
    }
    if ((data[2] & 0x02) != 0) {
        error = "truncated response";
        return std::nullopt;
    }
    int rcode = data[3] & 0x0F;
    if (rcode != 0) {
        error = rcode == 3 ? "NXDOMAIN" : "rcode " + std::to_string(rcode);
        return std::nullopt;
    }

    uint16_t questions = readU16(data, 4);
    uint16_t answers = readU16(data, 6);

    size_t offset = DNS_HEADER_SIZE;
    for (uint16_t i = 0; i < questions; ++i) {
        if (!skipName(data, offset) || offset + 4 > data.size()) {
            error = "malformed question section";
            return std::nullopt;
        }
        offset += 4;
    }

    for (uint16_t i = 0; i < answers; ++i) {
        if (!skipName(data, offset) || offset + 10 > data.size()) {
            error = "malformed answer section";
            return std::nullopt;
        }
        uint16_t type = readU16(data, offset);
        uint16_t klass = readU16(data, offset + 2);
        uint16_t rdLength = readU16(data, offset + 8);
        offset += 10;
        if (offset + rdLength > data.size()) {
            error = "malformed answer record";
            return std::nullopt;
        }
        if (type == TYPE_A && klass == CLASS_IN && rdLength == 4) {
            asio::ip::address_v4::bytes_type bytes{data[offset], data[offset + 1],
                                                   data[offset + 2], data[offset + 3]};
            return asio::ip::address_v4(bytes).to_string();
        }
        offset += rdLength;
    }

    error = "no A record in answer";
    return std::nullopt;
}

std::optional<std::vector<uint8_t>> DnsResolver::exchange(const std::vector<uint8_t>& query,
                                                          uint16_t expectedId,
                                                          std::chrono::milliseconds timeout,
                                                          std::string& error) {
    asio::io_context io;
    asio::error_code ec;

    auto serverAddress = asio::ip::make_address(options_.server, ec);
    if (ec) {
        error = "invalid DNS server address " + options_.server;
        return std::nullopt;
    }
    asio::ip::udp::endpoint server(serverAddress, options_.port);

    asio::ip::udp::socket socket(io);
    socket.open(server.protocol(), ec);
    if (ec) {
        error = "socket: " + ec.message();
        return std::nullopt;
    }

    std::array<uint8_t, 1500> buffer{};
    asio::ip::udp::endpoint sender;
    asio::error_code result = asio::error::would_block;
    size_t received = 0;

    // Datagrams from elsewhere or for another transaction are dropped and
    // the receive is re-armed until the timeout.
    std::function<void()> receiveNext = [&]() {
        socket.async_receive_from(
            asio::buffer(buffer), sender, [&](const asio::error_code& recvEc, std::size_t bytes) {
                if (recvEc) {
                    result = recvEc;
                    return;
                }
                uint16_t id = bytes >= 2 ? static_cast<uint16_t>((buffer[0] << 8) | buffer[1]) : 0;
                if (sender != server || bytes < 2 || id != expectedId) {
                    spdlog::debug("Ignoring unexpected DNS datagram from {}:{} ({} bytes)",
                                  sender.address().to_string(), sender.port(), bytes);
                    receiveNext();
                    return;
                }
                result = recvEc;
                received = bytes;
            });
    };

    ++queriesSent_;
    socket.async_send_to(asio::buffer(query), server,
                         [&](const asio::error_code& sendEc, std::size_t /*bytes*/) {
                             if (sendEc) {
                                 result = sendEc;
                                 return;
                             }
                             receiveNext();
                         });

    io.run_for(timeout);
    if (!io.stopped()) {
        asio::error_code ignored;
        socket.close(ignored);
        io.run();
        error = "timeout";
        return std::nullopt;
    }

    if (result) {
        error = result.message();
        return std::nullopt;
    }
    return std::vector<uint8_t>(buffer.begin(),
                                buffer.begin() + static_cast<std::ptrdiff_t>(received));
}

std::optional<std::string> DnsResolver::resolve(const std::string& hostname) {
    if (isIpLiteral(hostname)) {
        return hostname;
    }

    std::vector<uint8_t> query;
    uint16_t id = makeQueryId();
    try {
        query = buildQuery(id, hostname);
    } catch (const std::invalid_argument& e) {
        spdlog::error("DNS resolution failed for {}: {}", hostname, e.what());
        return std::nullopt;
    }

    auto deadline = std::chrono::steady_clock::now() + options_.lifetime;
    std::string error;

    for (;;) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            break;
        }

        auto response = exchange(query, id, std::min(options_.queryTimeout, remaining), error);
        if (response) {
            auto address = parseFirstARecord(*response, id, error);
            if (address) {
                spdlog::debug("Resolved {} to {} via {}", hostname, *address, options_.server);
                return address;
            }
            break;
        }
        if (error != "timeout") {
            break;
        }
    }

    spdlog::error("DNS resolution failed for {}: {}", hostname, error);
    return std::nullopt;
}

} // namespace connmon::infra

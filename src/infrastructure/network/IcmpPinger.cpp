#include "infrastructure/network/IcmpPinger.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <random>

#ifdef __linux__
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#endif

namespace connmon::infra {

namespace {

constexpr uint8_t ICMP_ECHO_REQUEST = 8;
constexpr uint8_t ICMP_ECHO_REPLY = 0;
constexpr size_t ICMP_HEADER_SIZE = 8;
constexpr size_t PACKET_SIZE = 64;

#ifdef __linux__
class SocketHandle {
public:
    explicit SocketHandle(int fd) : fd_(fd) {}
    ~SocketHandle() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }
    SocketHandle(const SocketHandle&) = delete;
    SocketHandle& operator=(const SocketHandle&) = delete;

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

private:
    int fd_;
};
#endif

} // namespace

IcmpPinger::IcmpPinger() {
    std::random_device rd;
    identifier_ = static_cast<uint16_t>(rd() & 0xFFFF);
}

uint16_t IcmpPinger::calculateChecksum(const uint8_t* data, size_t length) {
    uint32_t sum = 0;

    while (length > 1) {
        sum += (static_cast<uint16_t>(data[0]) << 8) | data[1];
        data += 2;
        length -= 2;
    }
    if (length == 1) {
        sum += static_cast<uint16_t>(data[0]) << 8;
    }
    while (sum >> 16) {
        sum = (sum & 0xFFFF) + (sum >> 16);
    }

    return static_cast<uint16_t>(~sum);
}

std::vector<uint8_t> IcmpPinger::buildEchoRequest(uint16_t identifier, uint16_t sequence) {
    std::vector<uint8_t> packet(PACKET_SIZE, 0);

    packet[0] = ICMP_ECHO_REQUEST;
    packet[4] = static_cast<uint8_t>(identifier >> 8);
    packet[5] = static_cast<uint8_t>(identifier & 0xFF);
    packet[6] = static_cast<uint8_t>(sequence >> 8);
    packet[7] = static_cast<uint8_t>(sequence & 0xFF);

    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    std::memcpy(&packet[ICMP_HEADER_SIZE], &stamp, sizeof(stamp));

    uint16_t checksum = calculateChecksum(packet.data(), packet.size());
    packet[2] = static_cast<uint8_t>(checksum >> 8);
    packet[3] = static_cast<uint8_t>(checksum & 0xFF);

    return packet;
}

IcmpReply IcmpPinger::ping(const std::string& address, std::chrono::milliseconds timeout) {
    IcmpReply reply;

#ifdef __linux__
    struct sockaddr_in dest {};
    dest.sin_family = AF_INET;
    if (inet_pton(AF_INET, address.c_str(), &dest.sin_addr) != 1) {
        reply.errorMessage = "not an IPv4 address: " + address;
        return reply;
    }

    bool raw = true;
    int fd = ::socket(AF_INET, SOCK_RAW, IPPROTO_ICMP);
    if (fd < 0) {
        raw = false;
        fd = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_ICMP);
    }
    SocketHandle sock(fd);
    if (!sock.valid()) {
        reply.errorMessage = "cannot open ICMP socket (need CAP_NET_RAW or ping_group_range)";
        spdlog::warn("Ping to {} failed: {}", address, reply.errorMessage);
        return reply;
    }

    uint16_t seq = sequenceNumber_++;
    auto packet = buildEchoRequest(identifier_, seq);

    auto sendTime = std::chrono::steady_clock::now();
    auto deadline = sendTime + timeout;

    if (::sendto(sock.get(), packet.data(), packet.size(), 0,
                 reinterpret_cast<struct sockaddr*>(&dest), sizeof(dest)) < 0) {
        reply.errorMessage = std::string("sendto: ") + std::strerror(errno);
        return reply;
    }

    std::array<uint8_t, 1024> buffer{};
    for (;;) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            reply.errorMessage = "timeout";
            return reply;
        }

        struct pollfd pfd {};
        pfd.fd = sock.get();
        pfd.events = POLLIN;
        int ready = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready == 0) {
            reply.errorMessage = "timeout";
            return reply;
        }
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            reply.errorMessage = std::string("poll: ") + std::strerror(errno);
            return reply;
        }

        struct sockaddr_in from {};
        socklen_t fromLen = sizeof(from);
        ssize_t received = ::recvfrom(sock.get(), buffer.data(), buffer.size(), 0,
                                      reinterpret_cast<struct sockaddr*>(&from), &fromLen);
        auto recvTime = std::chrono::steady_clock::now();
        if (received <= 0) {
            continue;
        }
        if (from.sin_addr.s_addr != dest.sin_addr.s_addr) {
            continue;
        }

        // Raw sockets deliver the IP header, datagram sockets start at ICMP.
        size_t ipHeaderLen = 0;
        std::optional<int> ttl;
        if (raw) {
            ipHeaderLen = static_cast<size_t>((buffer[0] & 0x0F) * 4);
            ttl = buffer[8];
        }
        if (static_cast<size_t>(received) < ipHeaderLen + ICMP_HEADER_SIZE) {
            continue;
        }

        const uint8_t* icmp = buffer.data() + ipHeaderLen;
        if (icmp[0] != ICMP_ECHO_REPLY) {
            continue;
        }
        uint16_t recvId = static_cast<uint16_t>((icmp[4] << 8) | icmp[5]);
        uint16_t recvSeq = static_cast<uint16_t>((icmp[6] << 8) | icmp[7]);

        // The kernel rewrites the identifier of datagram ICMP sockets.
        if (recvSeq != seq || (raw && recvId != identifier_)) {
            continue;
        }

        reply.success = true;
        reply.ttl = ttl;
        reply.latencyMs = std::chrono::duration<double, std::milli>(recvTime - sendTime).count();
        spdlog::debug("Ping to {} successful: {:.2f}ms", address, *reply.latencyMs);
        return reply;
    }
#else
    (void)address;
    (void)timeout;
    reply.errorMessage = "ICMP ping not implemented for this platform";
    return reply;
#endif
}

} // namespace connmon::infra

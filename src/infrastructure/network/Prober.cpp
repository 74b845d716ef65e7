#include "infrastructure/network/Prober.hpp"

#include <asio.hpp>
#include <spdlog/spdlog.h>

#include <memory>
#include <vector>

namespace connmon::infra {

namespace {

struct ConnectAttempt {
    ConnectAttempt(asio::io_context& io, uint16_t port, std::string service)
        : port(port), service(std::move(service)), socket(io) {}

    uint16_t port;
    std::string service;
    asio::ip::tcp::socket socket;
    std::chrono::steady_clock::time_point start;
    asio::error_code outcome{asio::error::would_block};
    double latencyMs{0.0};
};

} // namespace

Prober::Prober(ProberOptions options) : options_(options) {}

core::ProbeResult Prober::probe(const std::string& resolvedIp, const core::Target& target) {
    try {
        switch (target.protocol) {
        case core::Protocol::Tcp:
            return probeTcp(resolvedIp, target.port.value_or(0));
        case core::Protocol::Udp:
            return probeUdp(resolvedIp, target.port.value_or(0));
        case core::Protocol::Icmp:
            return probeIcmp(resolvedIp);
        case core::Protocol::Composite: {
            const auto& ports = !target.compositePorts.empty() || !target.compositeKind
                                    ? target.compositePorts
                                    : core::CompositePorts::forKind(*target.compositeKind);
            return probeComposite(resolvedIp, ports);
        }
        }
    } catch (const std::exception& e) {
        spdlog::debug("Probe of {} ({}) raised: {}", target.identityKey(), resolvedIp, e.what());
        auto result = core::ProbeResult::failure(e.what());
        result.resolvedIp = resolvedIp;
        return result;
    }
    return core::ProbeResult::failure("unsupported protocol");
}

std::map<uint16_t, core::PortProbeResult> Prober::connectAll(const std::string& ip,
                                                             const core::PortServiceMap& ports) {
    std::map<uint16_t, core::PortProbeResult> results;

    asio::error_code ec;
    auto address = asio::ip::make_address(ip, ec);
    if (ec) {
        spdlog::debug("Cannot probe invalid address {}: {}", ip, ec.message());
        for (const auto& [port, service] : ports) {
            results[port] = core::PortProbeResult{service, false, std::nullopt};
        }
        return results;
    }

    asio::io_context io;
    std::vector<std::unique_ptr<ConnectAttempt>> attempts;
    attempts.reserve(ports.size());

    for (const auto& [port, service] : ports) {
        auto attempt = std::make_unique<ConnectAttempt>(io, port, service);
        attempt->start = std::chrono::steady_clock::now();
        attempt->socket.async_connect(
            asio::ip::tcp::endpoint(address, port), [a = attempt.get()](const asio::error_code& e) {
                a->outcome = e;
                a->latencyMs = core::toLatencyMs(std::chrono::steady_clock::now() - a->start);
                asio::error_code ignored;
                a->socket.close(ignored);
            });
        attempts.push_back(std::move(attempt));
    }

    io.run_for(options_.connectTimeout);
    if (!io.stopped()) {
        for (auto& attempt : attempts) {
            asio::error_code ignored;
            attempt->socket.close(ignored);
        }
        io.run();
    }

    for (const auto& attempt : attempts) {
        core::PortProbeResult portResult;
        portResult.service = attempt->service;
        portResult.connected = !attempt->outcome;
        if (portResult.connected) {
            portResult.latencyMs = attempt->latencyMs;
        } else {
            auto reason = attempt->outcome == asio::error::operation_aborted
                              ? std::string("timeout")
                              : attempt->outcome.message();
            spdlog::debug("Connection failed to {}:{} (TCP): {}", ip, attempt->port, reason);
        }
        results[attempt->port] = portResult;
    }
    return results;
}

core::ProbeResult Prober::probeTcp(const std::string& ip, uint16_t port) {
    auto perPort = connectAll(ip, {{port, "TCP " + std::to_string(port)}});

    core::ProbeResult result;
    result.timestamp = std::chrono::system_clock::now();
    result.resolvedIp = ip;

    const auto& outcome = perPort[port];
    result.connected = outcome.connected;
    result.latencyMs = outcome.latencyMs;
    if (!result.connected) {
        result.errorMessage = "connection failed";
    }
    return result;
}

core::ProbeResult Prober::probeUdp(const std::string& ip, uint16_t port) {
    core::ProbeResult result;
    result.resolvedIp = ip;

    asio::error_code ec;
    auto address = asio::ip::make_address(ip, ec);
    if (ec) {
        result.errorMessage = "invalid address";
        result.timestamp = std::chrono::system_clock::now();
        return result;
    }

    asio::io_context io;
    asio::ip::udp::socket socket(io);
    asio::error_code outcome = asio::error::would_block;

    auto start = std::chrono::steady_clock::now();
    double latencyMs = 0.0;
    socket.async_connect(asio::ip::udp::endpoint(address, port),
                         [&](const asio::error_code& e) {
                             outcome = e;
                             latencyMs = core::toLatencyMs(std::chrono::steady_clock::now() - start);
                         });

    io.run_for(options_.connectTimeout);
    if (!io.stopped()) {
        asio::error_code ignored;
        socket.close(ignored);
        io.run();
    }

    asio::error_code ignored;
    socket.close(ignored);

    result.timestamp = std::chrono::system_clock::now();
    if (!outcome) {
        result.connected = true;
        result.latencyMs = latencyMs;
    } else {
        result.errorMessage = outcome.message();
        spdlog::debug("Connection failed to {}:{} (UDP): {}", ip, port, outcome.message());
    }
    return result;
}

core::ProbeResult Prober::probeIcmp(const std::string& ip) {
    auto reply = pinger_.ping(ip, options_.pingTimeout);

    core::ProbeResult result;
    result.timestamp = std::chrono::system_clock::now();
    result.resolvedIp = ip;
    result.connected = reply.success;
    if (reply.success && reply.latencyMs) {
        result.latencyMs = core::roundLatency(*reply.latencyMs);
    } else {
        result.errorMessage = reply.errorMessage;
        spdlog::debug("Ping failed to {} (ICMP): {}", ip, reply.errorMessage);
    }
    return result;
}

core::ProbeResult Prober::probeComposite(const std::string& ip, const core::PortServiceMap& ports) {
    auto result = summarizeComposite(connectAll(ip, ports));
    result.resolvedIp = ip;
    return result;
}

core::ProbeResult Prober::summarizeComposite(std::map<uint16_t, core::PortProbeResult> perPort) {
    core::ProbeResult result;
    result.timestamp = std::chrono::system_clock::now();

    double total = 0.0;
    int succeeded = 0;
    std::vector<uint16_t> failedPorts;
    for (const auto& [port, outcome] : perPort) {
        if (outcome.connected && outcome.latencyMs) {
            total += *outcome.latencyMs;
            ++succeeded;
        } else if (!outcome.connected) {
            failedPorts.push_back(port);
        }
    }

    result.connected = !perPort.empty() && failedPorts.empty();
    result.latencyMs = succeeded > 0 ? core::roundLatency(total / succeeded) : 0.0;
    if (perPort.empty()) {
        result.errorMessage = "no ports to probe";
    } else if (!failedPorts.empty()) {
        result.errorMessage = std::to_string(failedPorts.size()) + " of " +
                              std::to_string(perPort.size()) + " ports unreachable";
    }
    result.perPort = std::move(perPort);
    return result;
}

} // namespace connmon::infra

#include "monitoring/TargetCoordinator.hpp"

#include <spdlog/spdlog.h>

namespace connmon::monitoring {

TargetCoordinator::TargetCoordinator(asio::io_context& io, core::Target target,
                                     std::shared_ptr<core::IResolver> resolver,
                                     std::shared_ptr<core::IProber> prober,
                                     std::shared_ptr<core::IMacLookup> macLookup,
                                     std::chrono::seconds interval, std::string dnsServer)
    : target_(std::move(target)), resolver_(std::move(resolver)), prober_(std::move(prober)),
      macLookup_(std::move(macLookup)), interval_(interval), dnsServer_(std::move(dnsServer)),
      strand_(asio::make_strand(io)), timer_(strand_) {}

TargetCoordinator::~TargetCoordinator() {
    active_ = false;
}

void TargetCoordinator::start() {
    if (active_.exchange(true)) {
        return;
    }
    spdlog::debug("Starting coordinator for {} (every {}s)", entityId(), interval_.count());
    asio::post(strand_, [self = shared_from_this()]() {
        self->scheduleNextTick(std::chrono::steady_clock::duration::zero());
    });
}

void TargetCoordinator::stop() {
    if (!active_.exchange(false)) {
        return;
    }
    asio::post(strand_, [self = shared_from_this()]() { self->timer_.cancel(); });
    spdlog::debug("Stopped coordinator for {}", entityId());
}

void TargetCoordinator::scheduleNextTick(std::chrono::steady_clock::duration delay) {
    if (!active_.load()) {
        return;
    }

    timer_.expires_after(delay);
    timer_.async_wait([self = shared_from_this()](const asio::error_code& ec) {
        if (ec || !self->active_.load()) {
            return;
        }
        if (!self->refresh()) {
            spdlog::debug("Skipped tick of {}: previous tick still running", self->entityId());
        }
        self->scheduleNextTick(self->interval_);
    });
}

bool TargetCoordinator::refresh() {
    if (ticking_.exchange(true)) {
        return false;
    }

    auto result = runTick();

    ResultCallback callback;
    {
        std::lock_guard lock(mutex_);
        latest_ = result;
        callback = callback_;
    }
    ++ticks_;
    ticking_ = false;

    if (callback) {
        callback(target_, result);
    }
    return true;
}

core::ProbeResult TargetCoordinator::runTick() {
    core::ProbeResult result;
    try {
        auto ip = cachedIp();
        if (!ip) {
            ip = resolver_->resolve(target_.host);
            if (!ip) {
                spdlog::error("Could not resolve hostname {}", target_.host);
                result = core::ProbeResult::failure("resolution failed");
                result.timestamp = std::chrono::system_clock::now();
                return result;
            }
            std::lock_guard lock(mutex_);
            resolvedIp_ = ip;
        }

        result = prober_->probe(*ip, target_);
        result.resolvedIp = ip;

        bool lookupMac = false;
        {
            std::lock_guard lock(mutex_);
            lookupMac = macLookup_ && !macAttempted_;
            macAttempted_ = true;
        }
        if (lookupMac) {
            auto mac = macLookup_->lookup(*ip);
            std::lock_guard lock(mutex_);
            macAddress_ = mac;
        }
        result.macAddress = cachedMac();
    } catch (const std::exception& e) {
        spdlog::error("Tick of {} failed: {}", entityId(), e.what());
        auto resolved = result.resolvedIp;
        result = core::ProbeResult::failure(e.what());
        result.resolvedIp = resolved;
    }

    result.timestamp = std::chrono::system_clock::now();
    return result;
}

void TargetCoordinator::setResultCallback(ResultCallback callback) {
    std::lock_guard lock(mutex_);
    callback_ = std::move(callback);
}

std::optional<core::ProbeResult> TargetCoordinator::latest() const {
    std::lock_guard lock(mutex_);
    return latest_;
}

core::TargetState TargetCoordinator::state() const {
    std::lock_guard lock(mutex_);
    if (!latest_) {
        return core::TargetState::NotConnected;
    }
    return latest_->connected ? core::TargetState::Connected : core::TargetState::Disconnected;
}

bool TargetCoordinator::isResolved() const {
    std::lock_guard lock(mutex_);
    return resolvedIp_.has_value();
}

std::optional<std::string> TargetCoordinator::cachedIp() const {
    std::lock_guard lock(mutex_);
    return resolvedIp_;
}

std::optional<std::string> TargetCoordinator::cachedMac() const {
    std::lock_guard lock(mutex_);
    return macAddress_;
}

core::StatusValue TargetCoordinator::statusValue() const {
    auto result = latest();

    core::StatusValue value;
    value.entityId = entityId();
    value.kind = core::EntityKind::Target;
    value.state = core::targetStateToString(state());
    value.updatedAt = result ? result->timestamp : std::chrono::system_clock::now();

    auto& attrs = value.attributes;
    attrs["host"] = target_.host;
    attrs["name"] = target_.displayName();
    attrs["device_name"] = target_.deviceName;
    attrs["protocol"] = target_.protocolLabel();
    attrs["dns_server"] = dnsServer_;
    if (target_.port) {
        attrs["port"] = *target_.port;
    }
    if (target_.memberOf) {
        attrs["member_of"] = core::compositeKindToString(*target_.memberOf);
        attrs["service"] = core::CompositePorts::serviceName(*target_.memberOf, *target_.port);
    }
    if (target_.protocol == core::Protocol::Udp) {
        attrs["note"] = "UDP connect only verifies local socket setup, not a remote listener";
    }

    attrs["latency_ms"] = nullptr;
    attrs["resolved_ip"] = nullptr;
    attrs["mac_address"] = nullptr;
    if (result) {
        if (result->latencyMs) {
            attrs["latency_ms"] = *result->latencyMs;
        }
        if (result->resolvedIp) {
            attrs["resolved_ip"] = *result->resolvedIp;
        }
        if (result->macAddress) {
            attrs["mac_address"] = *result->macAddress;
        }
        if (!result->errorMessage.empty()) {
            attrs["error"] = result->errorMessage;
        }
        if (result->perPort) {
            auto ports = nlohmann::json::array();
            for (const auto& [port, outcome] : *result->perPort) {
                nlohmann::json entry;
                entry["port"] = port;
                entry["service"] = outcome.service;
                entry["connected"] = outcome.connected;
                entry["latency_ms"] = outcome.latencyMs ? nlohmann::json(*outcome.latencyMs)
                                                        : nlohmann::json(nullptr);
                ports.push_back(entry);
            }
            attrs["per_port"] = ports;
        }
    }
    return value;
}

} // namespace connmon::monitoring

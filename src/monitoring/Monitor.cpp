#include "monitoring/Monitor.hpp"

#include "infrastructure/network/DnsResolver.hpp"
#include "infrastructure/network/MacLookup.hpp"
#include "infrastructure/network/Prober.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace connmon::monitoring {

Monitor::Monitor(asio::io_context& io, std::shared_ptr<core::IStatusBoard> board,
                 std::shared_ptr<core::INotificationSink> sink, AlertEngine::Clock clock)
    : io_(io), board_(std::move(board)), sink_(std::move(sink)), clock_(std::move(clock)) {}

Monitor::~Monitor() {
    stop();

    std::lock_guard lock(mutex_);
    for (const auto& [key, coordinator] : coordinators_) {
        coordinator->setResultCallback(nullptr);
    }
}

void Monitor::setServices(MonitorServices services) {
    std::lock_guard lock(mutex_);
    serviceOverrides_ = std::move(services);
}

MonitorServices Monitor::defaultServices(const infra::MonitoringSettings& settings) {
    infra::DnsResolverOptions dns;
    dns.server = settings.dnsServer;
    dns.queryTimeout = std::chrono::milliseconds(settings.dnsTimeoutMs);
    dns.lifetime = std::chrono::milliseconds(settings.dnsLifetimeMs);

    infra::ProberOptions probe;
    probe.connectTimeout = std::chrono::milliseconds(settings.connectTimeoutMs);
    probe.pingTimeout = std::chrono::milliseconds(settings.pingTimeoutMs);

    MonitorServices services;
    services.resolver = std::make_shared<infra::DnsResolver>(dns);
    services.prober = std::make_shared<infra::Prober>(probe);
    if (settings.macLookup) {
        services.macLookup = std::make_shared<infra::MacLookup>();
    }
    return services;
}

bool Monitor::configure(const infra::AppConfig& config) {
    if (auto previous = alertEngine()) {
        previous->detach();
    }

    auto materialized =
        TargetRegistry::materialize(config.targets, config.alerts.defaultDelayMinutes);

    int intervalSeconds = std::clamp(config.monitoring.updateIntervalSeconds, 5, 300);
    if (intervalSeconds != config.monitoring.updateIntervalSeconds) {
        spdlog::warn("update interval {}s out of range [5, 300], using {}s",
                     config.monitoring.updateIntervalSeconds, intervalSeconds);
    }

    std::map<std::string, std::shared_ptr<TargetCoordinator>> coordinators;
    std::map<std::string, std::shared_ptr<HostAggregator>> aggregators;
    auto engine = std::make_shared<AlertEngine>(board_, sink_, clock_);
    uint64_t generation = 0;

    {
        std::lock_guard lock(mutex_);
        auto services =
            serviceOverrides_ ? *serviceOverrides_ : defaultServices(config.monitoring);
        generation = ++generation_;

        for (const auto& target : materialized.targets) {
            auto coordinator = std::make_shared<TargetCoordinator>(
                io_, target, services.resolver, services.prober, services.macLookup,
                std::chrono::seconds(intervalSeconds), config.monitoring.dnsServer);
            coordinator->setResultCallback(
                [this, generation](const core::Target& t, const core::ProbeResult& r) {
                    onResult(generation, t, r);
                });
            coordinators.emplace(coordinator->entityId(), coordinator);
        }

        for (const auto& group : materialized.hosts) {
            std::vector<std::shared_ptr<TargetCoordinator>> hostCoordinators;
            for (const auto& key : group.targetKeys) {
                hostCoordinators.push_back(coordinators.at(key));
            }
            aggregators.emplace(group.host,
                                std::make_shared<HostAggregator>(group, hostCoordinators));
        }

        materialized_ = std::move(materialized);
        coordinators_ = coordinators;
        aggregators_ = aggregators;
        alertEngine_ = engine;
        sweepInterval_ = std::chrono::seconds(config.alerts.sweepIntervalSeconds);
    }

    for (const auto& [key, coordinator] : coordinators) {
        board_->publish(coordinator->statusValue());
    }
    for (const auto& [host, aggregator] : aggregators) {
        publishHost(*aggregator);
    }

    engine->attach();
    for (const auto& [host, aggregator] : aggregators) {
        for (const auto& entityId : aggregator->entityIds()) {
            engine->watch(entityId, aggregator->alertSettings());
        }
    }

    spdlog::info("Monitor configured: {} targets on {} hosts, polling every {}s",
                 coordinators.size(), aggregators.size(), intervalSeconds);
    return !coordinators.empty();
}

void Monitor::start() {
    if (running_.exchange(true)) {
        return;
    }

    std::map<std::string, std::shared_ptr<TargetCoordinator>> coordinators;
    std::shared_ptr<AlertEngine> engine;
    std::chrono::seconds sweepInterval;
    {
        std::lock_guard lock(mutex_);
        coordinators = coordinators_;
        engine = alertEngine_;
        sweepInterval = sweepInterval_;
    }

    for (const auto& [key, coordinator] : coordinators) {
        coordinator->start();
    }
    if (engine) {
        engine->startSweep(io_, sweepInterval);
    }
    spdlog::info("Monitoring started ({} targets)", coordinators.size());
}

void Monitor::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    std::map<std::string, std::shared_ptr<TargetCoordinator>> coordinators;
    std::shared_ptr<AlertEngine> engine;
    {
        std::lock_guard lock(mutex_);
        coordinators = coordinators_;
        engine = alertEngine_;
    }

    for (const auto& [key, coordinator] : coordinators) {
        coordinator->stop();
    }
    if (engine) {
        engine->detach();
    }
    spdlog::info("Monitoring stopped");
}

bool Monitor::reconfigure(const infra::AppConfig& config) {
    bool wasRunning = running_.load();
    stop();

    {
        std::lock_guard lock(mutex_);
        if (alertEngine_) {
            alertEngine_->detach();
            alertEngine_->reset();
        }
        coordinators_.clear();
        aggregators_.clear();
        alertEngine_.reset();
    }
    board_->clear();

    bool ok = configure(config);
    if (wasRunning) {
        start();
    }
    spdlog::info("Monitor reconfigured");
    return ok;
}

void Monitor::onResult(uint64_t generation, const core::Target& target,
                       const core::ProbeResult& /*result*/) {
    std::shared_ptr<TargetCoordinator> coordinator;
    std::shared_ptr<HostAggregator> aggregator;
    {
        std::lock_guard lock(mutex_);
        if (generation != generation_) {
            return;
        }
        auto c = coordinators_.find(target.identityKey());
        auto a = aggregators_.find(target.host);
        if (c == coordinators_.end() || a == aggregators_.end()) {
            return;
        }
        coordinator = c->second;
        aggregator = a->second;
    }

    board_->publish(coordinator->statusValue());
    publishHost(*aggregator);
}

void Monitor::publishHost(HostAggregator& aggregator) {
    aggregator.publish(*board_);
}

std::vector<ConfigurationError> Monitor::configurationErrors() const {
    std::lock_guard lock(mutex_);
    return materialized_.errors;
}

std::vector<core::Target> Monitor::targets() const {
    std::lock_guard lock(mutex_);
    return materialized_.targets;
}

std::shared_ptr<TargetCoordinator> Monitor::coordinator(const std::string& entityId) const {
    std::lock_guard lock(mutex_);
    auto it = coordinators_.find(entityId);
    return it == coordinators_.end() ? nullptr : it->second;
}

std::vector<std::shared_ptr<TargetCoordinator>> Monitor::coordinators() const {
    std::lock_guard lock(mutex_);
    std::vector<std::shared_ptr<TargetCoordinator>> result;
    for (const auto& target : materialized_.targets) {
        auto it = coordinators_.find(target.identityKey());
        if (it != coordinators_.end()) {
            result.push_back(it->second);
        }
    }
    return result;
}

std::shared_ptr<HostAggregator> Monitor::aggregator(const std::string& host) const {
    std::lock_guard lock(mutex_);
    auto it = aggregators_.find(host);
    return it == aggregators_.end() ? nullptr : it->second;
}

std::shared_ptr<AlertEngine> Monitor::alertEngine() const {
    std::lock_guard lock(mutex_);
    return alertEngine_;
}

} // namespace connmon::monitoring
